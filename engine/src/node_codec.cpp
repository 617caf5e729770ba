#include "comment_engine/node_codec.hpp"
#include "comment_engine/errors.hpp"
#include <charconv>
#include <cstring>
#include <fmt/format.h>
#include <limits>
#include <system_error>
#include <string>
#include <utility>

namespace comments {

// Children always take their parent id from their position. An embedded value
// is accepted only when it agrees with that position.
static void attach_child(CommentNode& parent, std::unique_ptr<CommentNode> child) {
    if (child->parentId.has_value() && *child->parentId != parent.id) {
        throw DeserializationError("parent_id",
            fmt::format("comment {} is nested under {} but declares parent {}", child->id, parent.id, *child->parentId));
    }
    child->parentId = parent.id;
    parent.children.push_back(std::move(child));
}

// ---- structured (JSON) form ----

Json to_structured(const CommentNode& node) {
    Json out;
    out["id"] = node.id;
    out["text"] = node.text;
    out["author"] = node.author;
    out["parent_id"] = node.parentId.has_value() ? Json(*node.parentId) : Json(nullptr);
    out["children"] = Json::array();
    for (const auto& child : node.children) {
        out["children"].push_back(to_structured(*child));
    }
    return out;
}

static const Json& require_field(const Json& value, const char* field) {
    auto it = value.find(field);
    if (it == value.end()) throw DeserializationError(field, "missing field");
    return *it;
}

static CommentId as_comment_id(const Json& value, const char* field) {
    if (!value.is_number_integer()) {
        throw DeserializationError(field, fmt::format("expected an integer, got {}", value.type_name()));
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<CommentId>::max())) {
        throw DeserializationError(field, "integer out of range");
    }
    return value.get<CommentId>();
}

static std::string as_string(const Json& value, const char* field) {
    if (!value.is_string()) {
        throw DeserializationError(field, fmt::format("expected a string, got {}", value.type_name()));
    }
    return value.get<std::string>();
}

std::unique_ptr<CommentNode> from_structured(const Json& value) {
    if (!value.is_object()) {
        throw DeserializationError("comment", fmt::format("expected an object, got {}", value.type_name()));
    }
    auto node = std::make_unique<CommentNode>();
    node->id = as_comment_id(require_field(value, "id"), "id");
    node->text = as_string(require_field(value, "text"), "text");
    node->author = as_string(require_field(value, "author"), "author");
    const Json& parent = require_field(value, "parent_id");
    if (!parent.is_null()) node->parentId = as_comment_id(parent, "parent_id");

    const Json& children = require_field(value, "children");
    if (!children.is_array()) {
        throw DeserializationError("children", fmt::format("expected an array, got {}", children.type_name()));
    }
    for (const auto& childValue : children) {
        attach_child(*node, from_structured(childValue));
    }
    return node;
}

// ---- XML form ----

tinyxml2::XMLElement* to_xml_element(const CommentNode& node, tinyxml2::XMLDocument& doc) {
    tinyxml2::XMLElement* element = doc.NewElement("comment");
    element->SetAttribute("id", static_cast<int64_t>(node.id));
    element->SetAttribute("author", node.author.c_str());
    if (node.parentId.has_value()) {
        element->SetAttribute("parent_id", static_cast<int64_t>(*node.parentId));
    }
    tinyxml2::XMLElement* text = doc.NewElement("text");
    tinyxml2::XMLText* content = doc.NewText(node.text.c_str());
    // the parser drops whitespace-only character data; CDATA keeps it verbatim
    // ('\r' is excluded, print_xml writes it as a character reference instead)
    if (!node.text.empty() && node.text.find_first_not_of(" \t\n\v\f") == std::string::npos) {
        content->SetCData(true);
    }
    text->InsertEndChild(content);
    element->InsertEndChild(text);

    tinyxml2::XMLElement* children = doc.NewElement("children");
    for (const auto& child : node.children) {
        children->InsertEndChild(to_xml_element(*child, doc));
    }
    element->InsertEndChild(children);
    return element;
}

// Whole attribute must be a base-10 integer; no sign prefix, spaces or hex.
static CommentId query_id_attribute(const tinyxml2::XMLElement& element, const char* name) {
    const char* raw = element.Attribute(name);
    if (raw == nullptr) throw DeserializationError(name, "missing attribute");
    const char* end = raw + std::strlen(raw);
    CommentId value = 0;
    auto [ptr, ec] = std::from_chars(raw, end, value);
    if (ec == std::errc::result_out_of_range) {
        throw DeserializationError(name, fmt::format("'{}' is out of range", raw));
    }
    if (ec != std::errc() || ptr != end) {
        throw DeserializationError(name, fmt::format("'{}' is not an integer", raw));
    }
    return value;
}

std::unique_ptr<CommentNode> from_xml_element(const tinyxml2::XMLElement& element) {
    if (std::strcmp(element.Name(), "comment") != 0) {
        throw DeserializationError("comment", fmt::format("unexpected element <{}>", element.Name()));
    }
    auto node = std::make_unique<CommentNode>();
    node->id = query_id_attribute(element, "id");

    const char* author = element.Attribute("author");
    if (author == nullptr) throw DeserializationError("author", "missing attribute");
    node->author = author;

    const char* parent = element.Attribute("parent_id");
    if (parent != nullptr && *parent != '\0') node->parentId = query_id_attribute(element, "parent_id");

    const tinyxml2::XMLElement* text = element.FirstChildElement("text");
    if (text == nullptr) throw DeserializationError("text", "missing <text> element");
    node->text = text->GetText() != nullptr ? text->GetText() : "";

    // a comment without a <children> wrapper has no replies
    if (const tinyxml2::XMLElement* children = element.FirstChildElement("children")) {
        for (const auto* child = children->FirstChildElement(); child; child = child->NextSiblingElement()) {
            attach_child(*node, from_xml_element(*child));
        }
    }
    return node;
}

std::string print_xml(const tinyxml2::XMLDocument& doc, bool compact) {
    tinyxml2::XMLPrinter printer(nullptr, compact);
    doc.Print(&printer);
    std::string printed(printer.CStr(), static_cast<std::size_t>(printer.CStrSize() - 1));
    // The printer only emits '\r' from text and attribute values, and the parser
    // would fold it into '\n'. A character reference survives.
    std::string out;
    out.reserve(printed.size());
    for (char c : printed) {
        if (c == '\r') out += "&#13;";
        else out += c;
    }
    return out;
}

} // namespace comments
