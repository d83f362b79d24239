#include "node/public_file.hpp"
#include <boost/log/trivial.hpp>

namespace pubfs {
namespace node {

PublicFile::PublicFile(TimePoint time, const common::Cid& content_cid)
  : metadata_(time)
  , content_cid_(content_cid) {
}

PublicFile::PublicFile(Metadata metadata, const common::Cid& content_cid, std::set<common::Cid> previous)
  : metadata_(std::move(metadata))
  , content_cid_(content_cid)
  , previous_(std::move(previous)) {
}

common::Cid PublicFile::store(store::BlockStore& store) const {
  return persisted_as_.get_or_try_init([this, &store]() {
    common::Cid cid = store.put_serializable(to_serializable());
    BOOST_LOG_TRIVIAL(debug) << "Public file: Stored file as " << cid;
    return cid;
  });
}

codec::FileRecord PublicFile::to_serializable() const {
  codec::FileRecord record;
  record.metadata = metadata_.entries();
  record.content = content_cid_;
  record.previous = previous_;
  return record;
}

PublicFile PublicFile::from_serializable(const codec::FileRecord& record) {
  return PublicFile(Metadata(record.metadata), record.content, record.previous);
}

bool PublicFile::operator==(const PublicFile& other) const {
  return metadata_ == other.metadata_ &&
         content_cid_ == other.content_cid_ &&
         previous_ == other.previous_;
}

} // namespace node
} // namespace pubfs
