#ifndef PUBFS_CODEC_NODE_RECORD_HPP
#define PUBFS_CODEC_NODE_RECORD_HPP

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include "common/cid.hpp"

namespace pubfs {
namespace codec {

// Version written into every node record
inline const std::string NODE_RECORD_VERSION = "1.0.0";

// Tag distinguishing the node variants on the wire
enum class NodeTag : uint8_t {
  File = 0,
  Directory = 1
};

using MetadataValue = std::variant<int64_t, std::string>;
using MetadataMap = std::map<std::string, MetadataValue>;

// Serializable form of a file node
struct FileRecord {
  std::string version = NODE_RECORD_VERSION;
  MetadataMap metadata;
  common::Cid content;
  std::set<common::Cid> previous;
};

// Serializable form of a directory node, children already reduced to CIDs
struct DirectoryRecord {
  std::string version = NODE_RECORD_VERSION;
  MetadataMap metadata;
  std::map<std::string, common::Cid> entries;
  std::set<common::Cid> previous;
};

using NodeRecord = std::variant<FileRecord, DirectoryRecord>;

} // namespace codec
} // namespace pubfs

#endif // PUBFS_CODEC_NODE_RECORD_HPP
