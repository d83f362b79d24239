#ifndef PUBFS_NODE_PERSISTED_CID_HPP
#define PUBFS_NODE_PERSISTED_CID_HPP

#include <mutex>
#include <optional>
#include "common/cid.hpp"

namespace pubfs {
namespace node {

// Write-once cell holding the CID a node value was persisted under.
// A copy of a cell is always empty: a copied value has not been persisted.
class PersistedCid {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PersistedCid() = default;
  PersistedCid(const PersistedCid&) {}
  PersistedCid& operator=(const PersistedCid& other) {
    if (this != &other) {
      std::lock_guard<std::mutex> lock(mutex_);
      value_.reset();
    }
    return *this;
  }


  // ---- ACCESS ----
  std::optional<common::Cid> get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
  }

  // Sets the cell if empty, returns the value it holds afterwards
  common::Cid set(const common::Cid& cid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!value_) {
      value_ = cid;
    }
    return *value_;
  }

  // Returns the held CID, or runs init and keeps its result. Concurrent
  // callers wait for the running initializer. If init throws the cell
  // stays empty.
  template <typename Init>
  common::Cid get_or_try_init(Init&& init) {
    std::lock_guard<std::mutex> init_lock(init_mutex_);
    if (auto current = get()) {
      return *current;
    }
    common::Cid cid = init();
    return set(cid);
  }

private:
  // ---- PARAMETERS ----
  // init_mutex_ serializes initializers, mutex_ guards value_ so get() never waits on I/O
  mutable std::mutex mutex_;
  std::mutex init_mutex_;
  std::optional<common::Cid> value_;
};

} // namespace node
} // namespace pubfs

#endif // PUBFS_NODE_PERSISTED_CID_HPP
