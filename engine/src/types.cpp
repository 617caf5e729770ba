#include "comment_engine/types.hpp"
#include <utility>

namespace comments {

CommentNode::CommentNode(CommentId id, std::string text, std::string author, std::optional<CommentId> parentId)
    : id(id), text(std::move(text)), author(std::move(author)), parentId(parentId) {}

} // namespace comments
