#include "node/public_node.hpp"
#include <sstream>
#include <type_traits>
#include <boost/log/trivial.hpp>
#include "common/fs_error.hpp"
#include "node/public_directory.hpp"
#include "node/public_file.hpp"

namespace pubfs {
namespace node {

namespace {

// Gives mutable access to the value behind ptr. The value is cloned first
// unless ptr is its sole owner and it has never been persisted.
template <typename T>
T& make_mut(std::shared_ptr<T>& ptr) {
  if (ptr.use_count() != 1 || ptr->persisted_as()) {
    ptr = std::make_shared<T>(*ptr);
  }
  return *ptr;
}

template <typename Ptr>
using element_of = typename std::decay_t<Ptr>::element_type;

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PublicNode::PublicNode(std::shared_ptr<PublicFile> file)
  : inner_(std::move(file)) {
}

PublicNode::PublicNode(std::shared_ptr<PublicDirectory> dir)
  : inner_(std::move(dir)) {
}

PublicNode::PublicNode(PublicFile file)
  : inner_(std::make_shared<PublicFile>(std::move(file))) {
}

PublicNode::PublicNode(PublicDirectory dir)
  : inner_(std::make_shared<PublicDirectory>(std::move(dir))) {
}


//==============================================
// MUTATION
//==============================================

void PublicNode::upsert_mtime(TimePoint time) {
  std::visit([time](auto& ptr) {
    make_mut(ptr).metadata_.upsert_mtime(time);
  }, inner_);
}

PublicNode PublicNode::update_previous(const std::vector<common::Cid>& cids) const {
  return std::visit([&cids](const auto& ptr) {
    auto next = std::make_shared<element_of<decltype(ptr)>>(*ptr);
    next->previous_ = std::set<common::Cid>(cids.begin(), cids.end());
    return PublicNode(next);
  }, inner_);
}

void PublicNode::prepare_next_revision() {
  std::visit([](auto& ptr) {
    std::optional<common::Cid> previous_cid = ptr->persisted_as();
    if (!previous_cid) {
      make_mut(ptr);
      return;
    }

    auto next = std::make_shared<element_of<decltype(ptr)>>(*ptr);
    next->previous_ = {*previous_cid};
    ptr = next;
    BOOST_LOG_TRIVIAL(debug) << "Public node: Prepared revision following " << *previous_cid;
  }, inner_);
}


//==============================================
// QUERY OPERATIONS
//==============================================

const std::set<common::Cid>& PublicNode::get_previous() const {
  return std::visit([](const auto& ptr) -> const std::set<common::Cid>& {
    return ptr->get_previous();
  }, inner_);
}

const Metadata& PublicNode::get_metadata() const {
  return std::visit([](const auto& ptr) -> const Metadata& {
    return ptr->get_metadata();
  }, inner_);
}

std::optional<common::Cid> PublicNode::persisted_as() const {
  return std::visit([](const auto& ptr) {
    return ptr->persisted_as();
  }, inner_);
}

std::string PublicNode::get_id() const {
  std::ostringstream ss;
  std::visit([&ss](const auto& ptr) {
    ss << static_cast<const void*>(ptr.get());
  }, inner_);
  return ss.str();
}


//==============================================
// CASTS
//==============================================

std::shared_ptr<const PublicDirectory> PublicNode::as_dir() const {
  if (const auto* dir = std::get_if<std::shared_ptr<PublicDirectory>>(&inner_)) {
    return *dir;
  }
  BOOST_LOG_TRIVIAL(error) << "Public node: Node " << get_id() << " is not a directory";
  throw common::NotADirectory();
}

std::shared_ptr<const PublicFile> PublicNode::as_file() const {
  if (const auto* file = std::get_if<std::shared_ptr<PublicFile>>(&inner_)) {
    return *file;
  }
  BOOST_LOG_TRIVIAL(error) << "Public node: Node " << get_id() << " is not a file";
  throw common::NotAFile();
}

bool PublicNode::is_dir() const {
  return std::holds_alternative<std::shared_ptr<PublicDirectory>>(inner_);
}

bool PublicNode::is_file() const {
  return std::holds_alternative<std::shared_ptr<PublicFile>>(inner_);
}


//==============================================
// STORAGE
//==============================================

common::Cid PublicNode::store(store::BlockStore& store) const {
  return std::visit([&store](const auto& ptr) {
    return ptr->store(store);
  }, inner_);
}

PublicNode PublicNode::load(const common::Cid& cid, store::BlockStore& store) {
  BOOST_LOG_TRIVIAL(debug) << "Public node: Loading node " << cid;

  codec::NodeRecord record = store.get_deserializable(cid);

  // A loaded value is by definition persisted under cid
  if (const auto* file = std::get_if<codec::FileRecord>(&record)) {
    auto value = std::make_shared<PublicFile>(PublicFile::from_serializable(*file));
    value->persisted_as_.set(cid);
    return PublicNode(value);
  }

  auto value = std::make_shared<PublicDirectory>(
    PublicDirectory::from_serializable(std::get<codec::DirectoryRecord>(record)));
  value->persisted_as_.set(cid);
  return PublicNode(value);
}


//==============================================
// COMPARISON
//==============================================

bool PublicNode::operator==(const PublicNode& other) const {
  if (const auto* file = std::get_if<std::shared_ptr<PublicFile>>(&inner_)) {
    const auto* other_file = std::get_if<std::shared_ptr<PublicFile>>(&other.inner_);
    return other_file && (*file == *other_file || **file == **other_file);
  }

  const auto& dir = std::get<std::shared_ptr<PublicDirectory>>(inner_);
  const auto* other_dir = std::get_if<std::shared_ptr<PublicDirectory>>(&other.inner_);
  return other_dir && (dir == *other_dir || *dir == **other_dir);
}

} // namespace node
} // namespace pubfs
