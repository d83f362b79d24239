#ifndef PUBFS_STORE_MEMORY_BLOCK_STORE_HPP
#define PUBFS_STORE_MEMORY_BLOCK_STORE_HPP

#include <mutex>
#include <unordered_map>
#include "store/block_store.hpp"

namespace pubfs {
namespace store {

// Block store kept entirely in process memory
class MemoryBlockStore : public BlockStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemoryBlockStore() = default;
  ~MemoryBlockStore() override = default;


  // ---- CORE STORAGE OPERATIONS ----
  common::Cid put_block(const std::string& bytes, common::CodecType codec) override;
  void get_block(const common::Cid& cid, std::stringstream& output) override;


  // ---- QUERY OPERATIONS ----
  bool has_block(const common::Cid& cid) const override;
  // Returns the number of distinct blocks held
  std::size_t size() const;

private:
  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::unordered_map<common::Cid, std::string> blocks_;
};

} // namespace store
} // namespace pubfs

#endif // PUBFS_STORE_MEMORY_BLOCK_STORE_HPP
