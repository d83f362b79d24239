#ifndef PUBFS_NODE_PUBLIC_FILE_HPP
#define PUBFS_NODE_PUBLIC_FILE_HPP

#include <optional>
#include <set>
#include "common/cid.hpp"
#include "codec/node_record.hpp"
#include "node/metadata.hpp"
#include "node/persisted_cid.hpp"
#include "store/block_store.hpp"

namespace pubfs {
namespace node {

// File node. Refers to its content by CID, the content block itself is
// stored separately.
class PublicFile {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PublicFile(TimePoint time, const common::Cid& content_cid);


  // ---- GETTERS ----
  const Metadata& get_metadata() const { return metadata_; }
  const common::Cid& get_content_cid() const { return content_cid_; }
  const std::set<common::Cid>& get_previous() const { return previous_; }
  std::optional<common::Cid> persisted_as() const { return persisted_as_.get(); }


  // ---- STORAGE ----
  // Stores the file record, memoizing the resulting CID
  common::Cid store(store::BlockStore& store) const;
  codec::FileRecord to_serializable() const;
  static PublicFile from_serializable(const codec::FileRecord& record);


  bool operator==(const PublicFile& other) const;
  bool operator!=(const PublicFile& other) const { return !(*this == other); }

private:
  friend class PublicNode;

  PublicFile(Metadata metadata, const common::Cid& content_cid, std::set<common::Cid> previous);

  // ---- PARAMETERS ----
  Metadata metadata_;
  common::Cid content_cid_;
  std::set<common::Cid> previous_;
  mutable PersistedCid persisted_as_;
};

} // namespace node
} // namespace pubfs

#endif // PUBFS_NODE_PUBLIC_FILE_HPP
