#pragma once

#include "comment_engine/types.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <tinyxml2.h>

namespace comments {

using Json = nlohmann::ordered_json;

// Structured form: {id, text, author, parent_id, children: [...]}
Json to_structured(const CommentNode& node);
std::unique_ptr<CommentNode> from_structured(const Json& value);

// XML form: <comment id author [parent_id]><text/><children/></comment>
// The returned element belongs to doc and is not yet linked into it.
tinyxml2::XMLElement* to_xml_element(const CommentNode& node, tinyxml2::XMLDocument& doc);
std::unique_ptr<CommentNode> from_xml_element(const tinyxml2::XMLElement& element);

// Prints doc so that from_xml_element reads back identical text and authors.
std::string print_xml(const tinyxml2::XMLDocument& doc, bool compact);

} // namespace comments
