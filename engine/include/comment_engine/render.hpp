#pragma once

#include "comment_engine/options.hpp"
#include "comment_engine/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace comments {

class CommentTree;

// Outline line: indentUnit * depth, bullet, "text (by author)".
std::string format_comment_line(const CommentNode& node, std::size_t depth, const CodecOptions& options);

// Pre-order outline of node's subtree, node rendered at the given depth.
std::vector<std::string> render_subtree(const CommentNode& node, std::size_t depth, const CodecOptions& options);

// Box-drawing view of every root and its replies.
std::vector<std::string> render_tree_view(const CommentTree& tree);

} // namespace comments
