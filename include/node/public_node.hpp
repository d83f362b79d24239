#ifndef PUBFS_NODE_PUBLIC_NODE_HPP
#define PUBFS_NODE_PUBLIC_NODE_HPP

#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <boost/asio/post.hpp>
#include "common/cid.hpp"
#include "node/metadata.hpp"
#include "store/block_store.hpp"

namespace pubfs {
namespace node {

class PublicFile;
class PublicDirectory;

// A node of the public file system, either a file or a directory.
//
// The value behind a node is shared between copies of the handle and is
// never changed while shared: mutating operations clone the value first
// unless this handle is its only owner and it has not been persisted yet.
class PublicNode {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit PublicNode(std::shared_ptr<PublicFile> file);
  explicit PublicNode(std::shared_ptr<PublicDirectory> dir);
  PublicNode(PublicFile file);
  PublicNode(PublicDirectory dir);


  // ---- MUTATION ----
  // Sets the modified time of the underlying node
  void upsert_mtime(TimePoint time);
  // Returns a node whose previous set is built from cids, duplicates collapsed
  PublicNode update_previous(const std::vector<common::Cid>& cids) const;
  // Starts a new revision: if this node was persisted, the handle moves to a
  // copy whose previous set is exactly that CID
  void prepare_next_revision();


  // ---- QUERY OPERATIONS ----
  const std::set<common::Cid>& get_previous() const;
  const Metadata& get_metadata() const;
  // CID this exact value was persisted under, if any
  std::optional<common::Cid> persisted_as() const;
  // Address of the shared value, identifies the instance
  std::string get_id() const;


  // ---- CASTS ----
  // Throws NotADirectory if this node is a file
  std::shared_ptr<const PublicDirectory> as_dir() const;
  // Throws NotAFile if this node is a directory
  std::shared_ptr<const PublicFile> as_file() const;
  bool is_dir() const;
  bool is_file() const;


  // ---- STORAGE ----
  // Serializes the node to the block store and returns its CID. Directories
  // persist their in-memory children first.
  common::Cid store(store::BlockStore& store) const;
  // Loads a node from the block store
  static PublicNode load(const common::Cid& cid, store::BlockStore& store);

  // Runs store() on the given executor
  template <typename Executor>
  std::future<common::Cid> store_async(const Executor& executor, store::BlockStore& store) const {
    auto task = std::make_shared<std::packaged_task<common::Cid()>>(
      [node = *this, &store]() { return node.store(store); });
    std::future<common::Cid> result = task->get_future();
    boost::asio::post(executor, [task]() { (*task)(); });
    return result;
  }

  // Runs load() on the given executor
  template <typename Executor>
  static std::future<PublicNode> load_async(const Executor& executor, const common::Cid& cid,
                                            store::BlockStore& store) {
    auto task = std::make_shared<std::packaged_task<PublicNode()>>(
      [cid, &store]() { return PublicNode::load(cid, store); });
    std::future<PublicNode> result = task->get_future();
    boost::asio::post(executor, [task]() { (*task)(); });
    return result;
  }


  // ---- COMPARISON ----
  // Same variant and either the same instance or equal fields
  bool operator==(const PublicNode& other) const;
  bool operator!=(const PublicNode& other) const { return !(*this == other); }

private:
  // ---- PARAMETERS ----
  std::variant<std::shared_ptr<PublicFile>, std::shared_ptr<PublicDirectory>> inner_;
};

} // namespace node
} // namespace pubfs

#endif // PUBFS_NODE_PUBLIC_NODE_HPP
