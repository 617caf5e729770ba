#include "comment_engine/errors.hpp"
#include <fmt/format.h>
#include <utility>

namespace comments {

DuplicateIdError::DuplicateIdError(CommentId id)
    : CommentTreeError(fmt::format("comment id {} already exists", id)), id_(id) {}

ParentNotFoundError::ParentNotFoundError(CommentId parentId)
    : CommentTreeError(fmt::format("parent comment {} does not exist", parentId)), parentId_(parentId) {}

CommentNotFoundError::CommentNotFoundError(CommentId id)
    : CommentTreeError(fmt::format("comment {} does not exist", id)), id_(id) {}

DeserializationError::DeserializationError(std::string field, const std::string& detail)
    : CommentTreeError(fmt::format("invalid '{}': {}", field, detail)), field_(std::move(field)) {}

TextIoError::TextIoError(std::filesystem::path path, const std::string& detail)
    : CommentTreeError(fmt::format("{}: {}", path.string(), detail)), path_(std::move(path)) {}

} // namespace comments
