#ifndef PUBFS_NODE_PUBLIC_LINK_HPP
#define PUBFS_NODE_PUBLIC_LINK_HPP

#include <optional>
#include <variant>
#include "common/cid.hpp"
#include "node/public_node.hpp"
#include "store/block_store.hpp"

namespace pubfs {
namespace node {

// Directory entry pointing at a child, either by CID or as an in-memory node
class PublicLink {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit PublicLink(const common::Cid& cid);
  explicit PublicLink(PublicNode node);


  // ---- QUERY OPERATIONS ----
  // True if the link only holds a CID
  bool is_encoded() const;
  // The link's CID if known without touching the store
  std::optional<common::Cid> get_cid() const;
  // The in-memory node, nullptr for encoded links
  const PublicNode* get_value() const;


  // ---- RESOLUTION ----
  // Returns the child's CID, storing an in-memory child first
  common::Cid resolve_cid(store::BlockStore& store) const;
  // Returns the child node, loading an encoded child from the store
  PublicNode resolve_value(store::BlockStore& store) const;


  // ---- COMPARISON ----
  bool operator==(const PublicLink& other) const;
  bool operator!=(const PublicLink& other) const { return !(*this == other); }

private:
  // ---- PARAMETERS ----
  std::variant<common::Cid, PublicNode> inner_;
};

} // namespace node
} // namespace pubfs

#endif // PUBFS_NODE_PUBLIC_LINK_HPP
