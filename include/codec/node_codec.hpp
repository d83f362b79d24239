#ifndef PUBFS_CODEC_NODE_CODEC_HPP
#define PUBFS_CODEC_NODE_CODEC_HPP

#include <array>
#include <cstdint>
#include <iostream>
#include <string>
#include <boost/endian/conversion.hpp>
#include "codec/node_record.hpp"

namespace pubfs {
namespace codec {

class NodeCodec {
public:
  static constexpr std::array<char, 4> MAGIC = {'P', 'N', 'O', 'D'};

  // Upper bound on any decoded length prefix
  static constexpr uint32_t MAX_LENGTH = 64 * 1024 * 1024;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a node record to an output stream, returns bytes written
  static std::size_t serialize(const NodeRecord& record, std::ostream& output);
  // Deserializes a node record, the whole input must be consumed. Entries,
  // metadata keys and previous CIDs must be strictly ascending.
  static NodeRecord deserialize(std::istream& input);

  // Convenience wrappers over an in-memory buffer
  static std::string encode(const NodeRecord& record);
  static NodeRecord decode(const std::string& bytes);

private:
  // ---- RECORD BODIES ----
  static std::size_t write_file_body(std::ostream& output, const FileRecord& record);
  static std::size_t write_directory_body(std::ostream& output, const DirectoryRecord& record);
  static FileRecord read_file_body(std::istream& input);
  static DirectoryRecord read_directory_body(std::istream& input);


  // ---- FIELD ENCODING ----
  static std::size_t write_string(std::ostream& output, const std::string& value);
  static std::size_t write_cid(std::ostream& output, const common::Cid& cid);
  static std::size_t write_metadata(std::ostream& output, const MetadataMap& metadata);
  static std::size_t write_previous(std::ostream& output, const std::set<common::Cid>& previous);

  static std::string read_string(std::istream& input);
  static common::Cid read_cid(std::istream& input);
  static MetadataMap read_metadata(std::istream& input);
  static std::set<common::Cid> read_previous(std::istream& input);
  static uint32_t read_length(std::istream& input, const char* what);


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream, throws DecodeError on short read
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  template <typename T>
  static std::size_t write_integer(std::ostream& output, T value) {
    T network_value = boost::endian::native_to_big(value);
    write_bytes(output, &network_value, sizeof(network_value));
    return sizeof(network_value);
  }

  template <typename T>
  static T read_integer(std::istream& input) {
    T network_value;
    read_bytes(input, &network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace codec
} // namespace pubfs

#endif // PUBFS_CODEC_NODE_CODEC_HPP
