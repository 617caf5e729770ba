#include "comment_engine/render.hpp"
#include "comment_engine/comment_tree.hpp"
#include <fmt/format.h>

namespace comments {

static std::string label(const CommentNode& node) {
    return fmt::format("{} (by {})", node.text, node.author);
}

std::string format_comment_line(const CommentNode& node, std::size_t depth, const CodecOptions& options) {
    std::string line;
    for (std::size_t i = 0; i < depth; ++i) line += options.indentUnit;
    line += options.bullet;
    line += label(node);
    return line;
}

static void render_preorder(const CommentNode& node, std::size_t depth, const CodecOptions& options,
                            std::vector<std::string>& out) {
    out.push_back(format_comment_line(node, depth, options));
    for (const auto& child : node.children) {
        render_preorder(*child, depth + 1, options, out);
    }
}

std::vector<std::string> render_subtree(const CommentNode& node, std::size_t depth, const CodecOptions& options) {
    std::vector<std::string> out;
    render_preorder(node, depth, options, out);
    return out;
}

static void render_branch(const CommentNode& node, const std::string& prefix, bool isLast,
                          std::vector<std::string>& out) {
    out.push_back(prefix + (isLast ? "└── " : "├── ") + label(node));
    const std::string childPrefix = prefix + (isLast ? "    " : "│   ");
    for (std::size_t i = 0; i < node.children.size(); ++i) {
        render_branch(*node.children[i], childPrefix, i + 1 == node.children.size(), out);
    }
}

std::vector<std::string> render_tree_view(const CommentTree& tree) {
    std::vector<std::string> out;
    for (const CommentNode* root : tree.roots()) {
        out.push_back(label(*root));
        for (std::size_t i = 0; i < root->children.size(); ++i) {
            render_branch(*root->children[i], "", i + 1 == root->children.size(), out);
        }
    }
    return out;
}

} // namespace comments
