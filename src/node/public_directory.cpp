#include "node/public_directory.hpp"
#include <boost/log/trivial.hpp>
#include "common/fs_error.hpp"

namespace pubfs {
namespace node {

PublicDirectory::PublicDirectory(TimePoint time)
  : metadata_(time) {
}

PublicDirectory::PublicDirectory(Metadata metadata, Entries entries, std::set<common::Cid> previous)
  : metadata_(std::move(metadata))
  , entries_(std::move(entries))
  , previous_(std::move(previous)) {
}

//==============================================
// ENTRIES
//==============================================

void PublicDirectory::insert_entry(const std::string& name, PublicLink link) {
  check_not_persisted("insert entry");
  entries_.insert_or_assign(name, std::move(link));
}

bool PublicDirectory::remove_entry(const std::string& name) {
  check_not_persisted("remove entry");
  return entries_.erase(name) > 0;
}

void PublicDirectory::check_not_persisted(const char* operation) const {
  if (auto cid = persisted_as_.get()) {
    BOOST_LOG_TRIVIAL(error) << "Public directory: Cannot " << operation
                             << " on a directory already persisted as " << *cid;
    throw common::FsError(std::string("Public directory: Cannot ") + operation + " on a persisted directory");
  }
}

//==============================================
// STORAGE
//==============================================

common::Cid PublicDirectory::store(store::BlockStore& store) const {
  return persisted_as_.get_or_try_init([this, &store]() {
    common::Cid cid = store.put_serializable(to_serializable(store));
    BOOST_LOG_TRIVIAL(debug) << "Public directory: Stored directory with " << entries_.size()
                             << " entries as " << cid;
    return cid;
  });
}

codec::DirectoryRecord PublicDirectory::to_serializable(store::BlockStore& store) const {
  codec::DirectoryRecord record;
  record.metadata = metadata_.entries();
  record.previous = previous_;

  // Children must be addressable before the parent can be encoded
  for (const auto& [name, link] : entries_) {
    record.entries.emplace(name, link.resolve_cid(store));
  }
  return record;
}

PublicDirectory PublicDirectory::from_serializable(const codec::DirectoryRecord& record) {
  Entries entries;
  for (const auto& [name, cid] : record.entries) {
    entries.emplace(name, PublicLink(cid));
  }
  return PublicDirectory(Metadata(record.metadata), std::move(entries), record.previous);
}

bool PublicDirectory::operator==(const PublicDirectory& other) const {
  return metadata_ == other.metadata_ &&
         entries_ == other.entries_ &&
         previous_ == other.previous_;
}

} // namespace node
} // namespace pubfs
