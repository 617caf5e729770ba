#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace comments {

using CommentId = std::int64_t;

struct CommentNode {
    CommentId id = 0;
    std::string text;
    std::string author;
    std::optional<CommentId> parentId; // nullopt denotes root
    std::vector<std::unique_ptr<CommentNode>> children; // ordered, owned

    CommentNode() = default;
    CommentNode(CommentId id, std::string text, std::string author,
                std::optional<CommentId> parentId = std::nullopt);
};

// Partial update: an empty slot leaves the current value untouched.
struct CommentUpdate {
    std::optional<std::string> text;
    std::optional<std::string> author;
};

} // namespace comments
