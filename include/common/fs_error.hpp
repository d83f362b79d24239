#ifndef PUBFS_COMMON_FS_ERROR_HPP
#define PUBFS_COMMON_FS_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pubfs {
namespace common {

class FsError : public std::runtime_error {
public:
  explicit FsError(const std::string& message)
    : std::runtime_error(message) {}
};

// Directory-narrowing applied to a file node
class NotADirectory : public FsError {
public:
  NotADirectory()
    : FsError("Node: Not a directory") {}
};

// File-narrowing applied to a directory node
class NotAFile : public FsError {
public:
  NotAFile()
    : FsError("Node: Not a file") {}
};

class BlockStoreError : public std::runtime_error {
public:
  explicit BlockStoreError(const std::string& message)
    : std::runtime_error(message) {}
};

class BlockNotFound : public BlockStoreError {
public:
  explicit BlockNotFound(const std::string& cid)
    : BlockStoreError("Block store: Block not found: " + cid) {}
};

// Stored bytes do not match the node wire format
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string& message)
    : std::runtime_error("Decode error: " + message) {}
};

} // namespace common
} // namespace pubfs

#endif // PUBFS_COMMON_FS_ERROR_HPP
