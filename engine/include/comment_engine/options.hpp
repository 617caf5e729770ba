#pragma once

#include <string>

namespace comments {

struct CodecOptions {
    int jsonIndent = 4; // -1 for compact output
    bool ensureAscii = false;
    bool xmlCompact = false;
    bool xmlDeclaration = true;
    // Outline rendering
    std::string indentUnit = "    ";
    std::string bullet = "- ";
};

} // namespace comments
