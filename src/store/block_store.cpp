#include "store/block_store.hpp"
#include <boost/log/trivial.hpp>
#include "codec/node_codec.hpp"

namespace pubfs {
namespace store {

common::Cid BlockStore::put_serializable(const codec::NodeRecord& record) {
  std::string bytes = codec::NodeCodec::encode(record);
  common::Cid cid = put_block(bytes, common::CodecType::Node);
  BOOST_LOG_TRIVIAL(debug) << "Block store: Stored node record of " << bytes.size() << " bytes as " << cid;
  return cid;
}

codec::NodeRecord BlockStore::get_deserializable(const common::Cid& cid) {
  std::stringstream block;
  get_block(cid, block);

  if (cid.codec() != common::CodecType::Node) {
    BOOST_LOG_TRIVIAL(error) << "Block store: Block " << cid << " is not a node block";
    throw common::DecodeError(std::string("Block store: Expected node codec, found ") +
                              common::codec_type_to_string(cid.codec()));
  }

  return codec::NodeCodec::deserialize(block);
}

} // namespace store
} // namespace pubfs
