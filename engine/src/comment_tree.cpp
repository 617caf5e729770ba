#include "comment_engine/comment_tree.hpp"
#include "comment_engine/errors.hpp"
#include "comment_engine/logging.hpp"
#include "comment_engine/node_codec.hpp"
#include "comment_engine/render.hpp"
#include "comment_engine/text_file.hpp"
#include <algorithm>
#include <deque>
#include <fmt/format.h>
#include <unordered_set>
#include <utility>

namespace comments {

static void preorder_collect(const CommentNode& node, std::vector<CommentId>& out) {
    out.push_back(node.id);
    for (const auto& child : node.children) {
        preorder_collect(*child, out);
    }
}

static void preorder_visit(const CommentNode& node, const CommentTree::Visitor& action) {
    action(node);
    for (const auto& child : node.children) {
        preorder_visit(*child, action);
    }
}

// Grows geometrically so a following push_back cannot throw.
template <typename T>
static void reserve_slot(std::vector<T>& vec) {
    if (vec.size() == vec.capacity()) vec.reserve(vec.empty() ? 4 : vec.capacity() * 2);
}

// Indexes a reconstructed subtree, rejecting ids seen earlier in the document.
static void index_subtree(CommentNode& node, std::unordered_map<CommentId, CommentNode*>& index,
                          std::vector<CommentId>& order) {
    if (!index.emplace(node.id, &node).second) {
        throw DeserializationError("id", fmt::format("comment id {} appears more than once", node.id));
    }
    order.push_back(node.id);
    for (auto& child : node.children) {
        index_subtree(*child, index, order);
    }
}

CommentTree::CommentTree(CodecOptions options) : options_(std::move(options)) {}

const CommentNode& CommentTree::add_comment(CommentId id, std::string text, std::string author,
                                            std::optional<CommentId> parentId) {
    if (contains(id)) {
        engine_logger()->debug("rejected add: duplicate id {}", id);
        throw DuplicateIdError(id);
    }
    CommentNode* parent = nullptr;
    if (parentId.has_value()) {
        parent = find_mutable(*parentId);
        if (parent == nullptr) {
            engine_logger()->debug("rejected add of {}: missing parent {}", id, *parentId);
            throw ParentNotFoundError(*parentId);
        }
    }
    auto node = std::make_unique<CommentNode>(id, std::move(text), std::move(author), parentId);
    CommentNode* raw = node.get();
    auto& siblings = parent != nullptr ? parent->children : roots_;
    // allocate everything up front; the index insert is the last step that can fail
    reserve_slot(siblings);
    reserve_slot(order_);
    index_.emplace(id, raw);
    siblings.push_back(std::move(node));
    order_.push_back(id);
    if (parentId.has_value()) {
        engine_logger()->debug("added comment {} under {}", id, *parentId);
    } else {
        engine_logger()->debug("added root comment {}", id);
    }
    return *raw;
}

void CommentTree::update_comment(CommentId id, const CommentUpdate& update) {
    CommentNode* node = find_mutable(id);
    if (node == nullptr) {
        engine_logger()->debug("rejected update: missing comment {}", id);
        throw CommentNotFoundError(id);
    }
    if (update.text.has_value()) node->text = *update.text;
    if (update.author.has_value()) node->author = *update.author;
    engine_logger()->debug("updated comment {}", id);
}

void CommentTree::update_comment(CommentId id, std::optional<std::string> text, std::optional<std::string> author) {
    update_comment(id, CommentUpdate{ std::move(text), std::move(author) });
}

void CommentTree::delete_comment(CommentId id) {
    CommentNode* node = find_mutable(id);
    if (node == nullptr) {
        engine_logger()->debug("rejected delete: missing comment {}", id);
        throw CommentNotFoundError(id);
    }
    std::vector<CommentId> removed;
    preorder_collect(*node, removed);

    auto& siblings = node->parentId.has_value() ? index_.at(*node->parentId)->children : roots_;
    auto it = std::find_if(siblings.begin(), siblings.end(),
                           [node](const std::unique_ptr<CommentNode>& n) { return n.get() == node; });
    siblings.erase(it); // destroys the whole subtree

    std::unordered_set<CommentId> gone(removed.begin(), removed.end());
    for (CommentId rid : removed) index_.erase(rid);
    order_.erase(std::remove_if(order_.begin(), order_.end(), [&gone](CommentId c) { return gone.count(c) > 0; }),
                 order_.end());
    engine_logger()->debug("deleted comment {} with {} descendants", id, removed.size() - 1);
}

void CommentTree::clear() {
    roots_.clear();
    index_.clear();
    order_.clear();
}

bool CommentTree::contains(CommentId id) const {
    return index_.find(id) != index_.end();
}

const CommentNode* CommentTree::find(CommentId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
}

CommentNode* CommentTree::find_mutable(CommentId id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
}

const CommentNode& CommentTree::at(CommentId id) const {
    const CommentNode* node = find(id);
    if (node == nullptr) throw CommentNotFoundError(id);
    return *node;
}

const CommentNode& CommentTree::start_node(CommentId id) const {
    const CommentNode* node = find(id);
    if (node == nullptr) {
        engine_logger()->debug("rejected traversal: missing start comment {}", id);
        throw CommentNotFoundError(id);
    }
    return *node;
}

std::vector<const CommentNode*> CommentTree::roots() const {
    std::vector<const CommentNode*> out;
    out.reserve(roots_.size());
    for (const auto& root : roots_) out.push_back(root.get());
    return out;
}

std::size_t CommentTree::depth_of(CommentId id) const {
    std::size_t depth = 0;
    const CommentNode* cur = &at(id);
    while (cur->parentId.has_value()) {
        cur = &at(*cur->parentId);
        ++depth;
    }
    return depth;
}

void CommentTree::traverse_depth_first(std::optional<CommentId> startId, const Visitor& action) const {
    if (startId.has_value()) {
        preorder_visit(start_node(*startId), action);
        return;
    }
    for (const auto& root : roots_) {
        preorder_visit(*root, action);
    }
}

void CommentTree::traverse_breadth_first(std::optional<CommentId> startId, const Visitor& action) const {
    std::deque<const CommentNode*> queue;
    if (startId.has_value()) {
        queue.push_back(&start_node(*startId));
    } else {
        for (const auto& root : roots_) queue.push_back(root.get());
    }
    while (!queue.empty()) {
        const CommentNode* node = queue.front();
        queue.pop_front();
        action(*node);
        for (const auto& child : node->children) queue.push_back(child.get());
    }
}

std::string CommentTree::to_json(const std::optional<std::filesystem::path>& filename) const {
    Json doc;
    doc["comments"] = Json::array();
    for (const auto& root : roots_) {
        doc["comments"].push_back(to_structured(*root));
    }
    std::string text;
    try {
        text = doc.dump(options_.jsonIndent, ' ', options_.ensureAscii);
    } catch (const nlohmann::json::type_error& e) {
        // comment text or author holding invalid UTF-8
        throw CommentTreeError(fmt::format("cannot encode comments as JSON: {}", e.what()));
    }
    if (filename.has_value()) write_text_file(*filename, text);
    return text;
}

static std::vector<std::unique_ptr<CommentNode>> json_roots(std::string_view data) {
    Json doc;
    try {
        doc = Json::parse(data.begin(), data.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw DeserializationError("document", e.what());
    }
    if (!doc.is_object() || !doc.contains("comments")) {
        throw DeserializationError("comments", "expected an object with a 'comments' array");
    }
    const Json& list = doc["comments"];
    if (!list.is_array()) {
        throw DeserializationError("comments", fmt::format("expected an array, got {}", list.type_name()));
    }
    std::vector<std::unique_ptr<CommentNode>> roots;
    for (const auto& value : list) {
        auto root = from_structured(value);
        if (root->parentId.has_value()) {
            throw DeserializationError("parent_id", fmt::format("top-level comment {} declares a parent", root->id));
        }
        roots.push_back(std::move(root));
    }
    return roots;
}

void CommentTree::from_json(std::string_view data) {
    try {
        replace_with(json_roots(data));
    } catch (const DeserializationError& e) {
        engine_logger()->debug("rejected JSON document: {}", e.what());
        throw;
    }
}

std::string CommentTree::to_xml(const std::optional<std::filesystem::path>& filename) const {
    tinyxml2::XMLDocument doc;
    if (options_.xmlDeclaration) doc.InsertFirstChild(doc.NewDeclaration());
    tinyxml2::XMLElement* top = doc.NewElement("comments");
    doc.InsertEndChild(top);
    for (const auto& root : roots_) {
        top->InsertEndChild(to_xml_element(*root, doc));
    }
    std::string text = print_xml(doc, options_.xmlCompact);
    if (filename.has_value()) write_text_file(*filename, text);
    return text;
}

static std::vector<std::unique_ptr<CommentNode>> xml_roots(std::string_view xmlText) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xmlText.data(), xmlText.size()) != tinyxml2::XML_SUCCESS) {
        throw DeserializationError("document", doc.ErrorStr());
    }
    const tinyxml2::XMLElement* top = doc.RootElement();
    if (top == nullptr || std::string(top->Name()) != "comments") {
        throw DeserializationError("comments", "expected a <comments> root element");
    }
    std::vector<std::unique_ptr<CommentNode>> roots;
    for (const auto* element = top->FirstChildElement(); element; element = element->NextSiblingElement()) {
        auto root = from_xml_element(*element);
        if (root->parentId.has_value()) {
            throw DeserializationError("parent_id", fmt::format("top-level comment {} declares a parent", root->id));
        }
        roots.push_back(std::move(root));
    }
    return roots;
}

void CommentTree::from_xml(std::string_view xmlText) {
    try {
        replace_with(xml_roots(xmlText));
    } catch (const DeserializationError& e) {
        engine_logger()->debug("rejected XML document: {}", e.what());
        throw;
    }
}

void CommentTree::load_json_file(const std::filesystem::path& path) {
    from_json(read_text_file(path));
}

void CommentTree::load_xml_file(const std::filesystem::path& path) {
    from_xml(read_text_file(path));
}

void CommentTree::replace_with(std::vector<std::unique_ptr<CommentNode>> roots) {
    std::unordered_map<CommentId, CommentNode*> index;
    std::vector<CommentId> order;
    for (auto& root : roots) {
        index_subtree(*root, index, order);
    }
    roots_ = std::move(roots);
    index_ = std::move(index);
    order_ = std::move(order);
    engine_logger()->debug("loaded {} comments ({} roots)", index_.size(), roots_.size());
}

void CommentTree::print_depth_first(std::ostream& out, std::optional<CommentId> startId) const {
    std::vector<std::string> lines;
    traverse_depth_first(startId, [&](const CommentNode& node) {
        lines.push_back(format_comment_line(node, depth_of(node.id), options_));
    });
    for (const auto& line : lines) out << line << '\n';
}

void CommentTree::print_breadth_first(std::ostream& out, std::optional<CommentId> startId) const {
    std::vector<std::string> lines;
    traverse_breadth_first(startId, [&](const CommentNode& node) {
        lines.push_back(format_comment_line(node, depth_of(node.id), options_));
    });
    for (const auto& line : lines) out << line << '\n';
}

} // namespace comments
