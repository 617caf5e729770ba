#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace comments {

// Whole-file text sink/source. Failures raise TextIoError.
void write_text_file(const std::filesystem::path& path, std::string_view text);
std::string read_text_file(const std::filesystem::path& path);

} // namespace comments
