#include "comment_engine/text_file.hpp"
#include "comment_engine/errors.hpp"
#include "comment_engine/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace comments {

static std::string last_error() {
    return errno != 0 ? std::strerror(errno) : std::string("stream failure");
}

void write_text_file(const std::filesystem::path& path, std::string_view text) {
    errno = 0;
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) throw TextIoError(path, "cannot open for writing: " + last_error());
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    ofs.flush();
    if (!ofs) throw TextIoError(path, "write failed: " + last_error());
    engine_logger()->info("wrote {} bytes to {}", text.size(), path.string());
}

std::string read_text_file(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) throw TextIoError(path, "cannot open for reading: " + last_error());
    std::string text{ std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>() };
    if (ifs.bad()) throw TextIoError(path, "read failed: " + last_error());
    return text;
}

} // namespace comments
