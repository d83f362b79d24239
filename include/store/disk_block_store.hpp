#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "store/block_store.hpp"

namespace pubfs {
namespace store {

// Block store keeping one file per block beneath a base directory
class DiskBlockStore : public BlockStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DiskBlockStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Writes the block unless a block with the same CID is already present
  common::Cid put_block(const std::string& bytes, common::CodecType codec) override;
  // Streams the block stored under cid into output
  void get_block(const common::Cid& cid, std::stringstream& output) override;
  // Removes the block stored under cid and prunes empty shard directories
  void remove_block(const common::Cid& cid);
  // Removes all stored blocks and resets the store
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has_block(const common::Cid& cid) const override;
  // Returns the size of the stored block in bytes
  std::uintmax_t get_block_size(const common::Cid& cid) const;
  const std::filesystem::path& get_base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored blocks
  std::filesystem::path base_path_;
  mutable std::mutex mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // Creates a directory structure using parts of the CID hex:
  // {base_path}/{hex[0:2]}/{hex[2:4]}/{hex[4:6]}/{remaining_hex}
  std::filesystem::path get_path_for_cid(const common::Cid& cid) const;


  // ---- QUERY OPERATIONS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Verifies if a file exists at the given path, throws BlockNotFound if not found
  void verify_block_exists(const std::filesystem::path& block_path, const common::Cid& cid) const;
};

} // namespace store
} // namespace pubfs
