#ifndef PUBFS_NODE_PUBLIC_DIRECTORY_HPP
#define PUBFS_NODE_PUBLIC_DIRECTORY_HPP

#include <map>
#include <optional>
#include <set>
#include <string>
#include "common/cid.hpp"
#include "codec/node_record.hpp"
#include "node/metadata.hpp"
#include "node/persisted_cid.hpp"
#include "node/public_link.hpp"
#include "store/block_store.hpp"

namespace pubfs {
namespace node {

// Directory node. Entries map names to links, which may still hold
// in-memory children that have never been stored.
class PublicDirectory {
public:
  using Entries = std::map<std::string, PublicLink>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit PublicDirectory(TimePoint time);


  // ---- GETTERS ----
  const Metadata& get_metadata() const { return metadata_; }
  const std::set<common::Cid>& get_previous() const { return previous_; }
  const Entries& get_entries() const { return entries_; }
  std::optional<common::Cid> persisted_as() const { return persisted_as_.get(); }


  // ---- ENTRIES ----
  // Adds or replaces an entry. Throws FsError once the value was persisted.
  void insert_entry(const std::string& name, PublicLink link);
  // Returns false if there was no such entry. Throws FsError once persisted.
  bool remove_entry(const std::string& name);


  // ---- STORAGE ----
  // Stores every in-memory child, then the directory record itself
  common::Cid store(store::BlockStore& store) const;
  // Builds the record, resolving each entry to a CID through the store
  codec::DirectoryRecord to_serializable(store::BlockStore& store) const;
  static PublicDirectory from_serializable(const codec::DirectoryRecord& record);


  bool operator==(const PublicDirectory& other) const;
  bool operator!=(const PublicDirectory& other) const { return !(*this == other); }

private:
  friend class PublicNode;

  PublicDirectory(Metadata metadata, Entries entries, std::set<common::Cid> previous);

  void check_not_persisted(const char* operation) const;

  // ---- PARAMETERS ----
  Metadata metadata_;
  Entries entries_;
  std::set<common::Cid> previous_;
  mutable PersistedCid persisted_as_;
};

} // namespace node
} // namespace pubfs

#endif // PUBFS_NODE_PUBLIC_DIRECTORY_HPP
