#include "store/memory_block_store.hpp"
#include <boost/log/trivial.hpp>

namespace pubfs {
namespace store {

common::Cid MemoryBlockStore::put_block(const std::string& bytes, common::CodecType codec) {
  common::Cid cid = common::Cid::compute(codec, bytes);

  std::lock_guard<std::mutex> lock(mutex_);
  blocks_.emplace(cid, bytes);
  BOOST_LOG_TRIVIAL(debug) << "Memory block store: Stored " << bytes.size() << " bytes as " << cid
                           << ". Block count: " << blocks_.size();
  return cid;
}

void MemoryBlockStore::get_block(const common::Cid& cid, std::stringstream& output) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = blocks_.find(cid);
  if (it == blocks_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Memory block store: Block not found: " << cid;
    throw common::BlockNotFound(cid.to_string());
  }

  output.write(it->second.data(), it->second.size());
  if (!output.good()) {
    throw common::BlockStoreError("Memory block store: Failed to write to output stream");
  }
}

bool MemoryBlockStore::has_block(const common::Cid& cid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.count(cid) > 0;
}

std::size_t MemoryBlockStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

} // namespace store
} // namespace pubfs
