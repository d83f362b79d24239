#include "node/public_link.hpp"
#include <boost/log/trivial.hpp>

namespace pubfs {
namespace node {

PublicLink::PublicLink(const common::Cid& cid)
  : inner_(cid) {
}

PublicLink::PublicLink(PublicNode node)
  : inner_(std::move(node)) {
}

bool PublicLink::is_encoded() const {
  return std::holds_alternative<common::Cid>(inner_);
}

std::optional<common::Cid> PublicLink::get_cid() const {
  if (const auto* cid = std::get_if<common::Cid>(&inner_)) {
    return *cid;
  }
  return std::get<PublicNode>(inner_).persisted_as();
}

const PublicNode* PublicLink::get_value() const {
  return std::get_if<PublicNode>(&inner_);
}

common::Cid PublicLink::resolve_cid(store::BlockStore& store) const {
  if (const auto* cid = std::get_if<common::Cid>(&inner_)) {
    return *cid;
  }
  return std::get<PublicNode>(inner_).store(store);
}

PublicNode PublicLink::resolve_value(store::BlockStore& store) const {
  if (const auto* node = std::get_if<PublicNode>(&inner_)) {
    return *node;
  }
  const common::Cid& cid = std::get<common::Cid>(inner_);
  BOOST_LOG_TRIVIAL(debug) << "Public link: Loading child node " << cid;
  return PublicNode::load(cid, store);
}

// An encoded link equals an in-memory one only if that node was persisted under the same CID
bool PublicLink::operator==(const PublicLink& other) const {
  const auto* node = get_value();
  const auto* other_node = other.get_value();

  if (node && other_node) {
    return *node == *other_node;
  }
  if (!node && !other_node) {
    return std::get<common::Cid>(inner_) == std::get<common::Cid>(other.inner_);
  }

  std::optional<common::Cid> cid = get_cid();
  std::optional<common::Cid> other_cid = other.get_cid();
  return cid && other_cid && *cid == *other_cid;
}

} // namespace node
} // namespace pubfs
