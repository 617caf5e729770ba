#pragma once

#include "comment_engine/options.hpp"
#include "comment_engine/types.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace comments {

class CommentTree {
public:
    using Visitor = std::function<void(const CommentNode&)>;

    explicit CommentTree(CodecOptions options = CodecOptions{});

    CommentTree(const CommentTree&) = delete;
    CommentTree& operator=(const CommentTree&) = delete;
    CommentTree(CommentTree&&) = default;
    CommentTree& operator=(CommentTree&&) = default;

    // Mutation. Preconditions are checked before anything changes.
    const CommentNode& add_comment(CommentId id, std::string text, std::string author,
                                   std::optional<CommentId> parentId = std::nullopt);
    void update_comment(CommentId id, const CommentUpdate& update);
    void update_comment(CommentId id, std::optional<std::string> text,
                        std::optional<std::string> author = std::nullopt);
    // Removes id and its whole subtree.
    void delete_comment(CommentId id);
    void clear();

    // Lookup
    bool contains(CommentId id) const;
    const CommentNode* find(CommentId id) const;
    const CommentNode& at(CommentId id) const;
    std::size_t size() const { return index_.size(); }
    bool empty() const { return index_.empty(); }
    std::vector<CommentId> ids() const { return order_; } // insertion order
    std::vector<const CommentNode*> roots() const;
    // Number of ancestor links between id and its root.
    std::size_t depth_of(CommentId id) const;

    // Traversal. Without startId every root is walked in insertion order.
    void traverse_depth_first(std::optional<CommentId> startId, const Visitor& action) const;
    void traverse_breadth_first(std::optional<CommentId> startId, const Visitor& action) const;

    // Serialization. When filename is set the text is also written there.
    std::string to_json(const std::optional<std::filesystem::path>& filename = std::nullopt) const;
    std::string to_xml(const std::optional<std::filesystem::path>& filename = std::nullopt) const;
    // Full replace; on failure the current tree is kept.
    void from_json(std::string_view data);
    void from_xml(std::string_view xmlText);
    void load_json_file(const std::filesystem::path& path);
    void load_xml_file(const std::filesystem::path& path);

    // One indented "- text (by author)" line per visited node.
    void print_depth_first(std::ostream& out, std::optional<CommentId> startId = std::nullopt) const;
    void print_breadth_first(std::ostream& out, std::optional<CommentId> startId = std::nullopt) const;

    const CodecOptions& options() const { return options_; }

private:
    CommentNode* find_mutable(CommentId id);
    const CommentNode& start_node(CommentId id) const;
    void replace_with(std::vector<std::unique_ptr<CommentNode>> roots);

    std::vector<std::unique_ptr<CommentNode>> roots_; // ordered root nodes
    std::unordered_map<CommentId, CommentNode*> index_;
    std::vector<CommentId> order_;
    CodecOptions options_;
};

} // namespace comments
