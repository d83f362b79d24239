#ifndef PUBFS_STORE_BLOCK_STORE_HPP
#define PUBFS_STORE_BLOCK_STORE_HPP

#include <sstream>
#include <string>
#include "common/cid.hpp"
#include "common/fs_error.hpp"
#include "codec/node_record.hpp"

namespace pubfs {
namespace store {

// Content-addressable block storage. Implementations must be safe to call
// from several threads at once.
class BlockStore {
public:
  virtual ~BlockStore() = default;


  // ---- CORE STORAGE OPERATIONS ----
  // Stores bytes and returns the CID they hash to under the given codec
  virtual common::Cid put_block(const std::string& bytes, common::CodecType codec) = 0;
  // Streams the block stored under cid, throws BlockNotFound if absent
  virtual void get_block(const common::Cid& cid, std::stringstream& output) = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool has_block(const common::Cid& cid) const = 0;


  // ---- SERIALIZABLE VALUES ----
  // Encodes a node record and stores it as a node block
  common::Cid put_serializable(const codec::NodeRecord& record);
  // Fetches a block and decodes it as a node record
  codec::NodeRecord get_deserializable(const common::Cid& cid);
};

} // namespace store
} // namespace pubfs

#endif // PUBFS_STORE_BLOCK_STORE_HPP
