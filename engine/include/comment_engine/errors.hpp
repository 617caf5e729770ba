#pragma once

#include "comment_engine/types.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace comments {

class CommentTreeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DuplicateIdError : public CommentTreeError {
public:
    explicit DuplicateIdError(CommentId id);
    CommentId id() const { return id_; }
private:
    CommentId id_;
};

class ParentNotFoundError : public CommentTreeError {
public:
    explicit ParentNotFoundError(CommentId parentId);
    CommentId parent_id() const { return parentId_; }
private:
    CommentId parentId_;
};

class CommentNotFoundError : public CommentTreeError {
public:
    explicit CommentNotFoundError(CommentId id);
    CommentId id() const { return id_; }
private:
    CommentId id_;
};

// Malformed JSON/XML document; field() names the offending field or element.
class DeserializationError : public CommentTreeError {
public:
    DeserializationError(std::string field, const std::string& detail);
    const std::string& field() const { return field_; }
private:
    std::string field_;
};

// Raised by the file sink/source, never by the codecs.
class TextIoError : public CommentTreeError {
public:
    TextIoError(std::filesystem::path path, const std::string& detail);
    const std::filesystem::path& path() const { return path_; }
private:
    std::filesystem::path path_;
};

} // namespace comments
