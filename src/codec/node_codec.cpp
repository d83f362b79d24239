#include "codec/node_codec.hpp"
#include <sstream>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>
#include "common/fs_error.hpp"

namespace pubfs {
namespace codec {

using common::Cid;
using common::DecodeError;

namespace {

// Kind byte preceding every metadata value
enum class MetadataKind : uint8_t {
  Integer = 0,
  String = 1
};

} // namespace

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t NodeCodec::serialize(const NodeRecord& record, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Node codec: Invalid output stream state";
    throw std::runtime_error("Node codec: Invalid output stream");
  }

  std::size_t total_bytes = 0;

  try {
    write_bytes(output, MAGIC.data(), MAGIC.size());
    total_bytes += MAGIC.size();

    if (const auto* file = std::get_if<FileRecord>(&record)) {
      total_bytes += write_integer<uint8_t>(output, static_cast<uint8_t>(NodeTag::File));
      total_bytes += write_string(output, file->version);
      total_bytes += write_file_body(output, *file);
    } else {
      const auto& dir = std::get<DirectoryRecord>(record);
      total_bytes += write_integer<uint8_t>(output, static_cast<uint8_t>(NodeTag::Directory));
      total_bytes += write_string(output, dir.version);
      total_bytes += write_directory_body(output, dir);
    }

    output.flush();
    BOOST_LOG_TRIVIAL(debug) << "Node codec: Serialized node record, total bytes written: " << total_bytes;
    return total_bytes;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node codec: Error during serialization: " << e.what();
    throw;
  }
}

NodeRecord NodeCodec::deserialize(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Node codec: Invalid input stream state";
    throw DecodeError("Node codec: Invalid input stream");
  }

  try {
    std::array<char, 4> magic{};
    read_bytes(input, magic.data(), magic.size());
    if (magic != MAGIC) {
      throw DecodeError("Node codec: Bad magic");
    }

    uint8_t tag = read_integer<uint8_t>(input);
    std::string version = read_string(input);
    if (version != NODE_RECORD_VERSION) {
      throw DecodeError("Node codec: Unsupported version '" + version + "'");
    }

    NodeRecord record;
    switch (static_cast<NodeTag>(tag)) {
      case NodeTag::File: {
        FileRecord file = read_file_body(input);
        file.version = version;
        record = std::move(file);
        break;
      }
      case NodeTag::Directory: {
        DirectoryRecord dir = read_directory_body(input);
        dir.version = version;
        record = std::move(dir);
        break;
      }
      default:
        throw DecodeError("Node codec: Unknown node tag " + std::to_string(tag));
    }

    // Block must hold exactly one record
    if (input.peek() != std::char_traits<char>::eof()) {
      throw DecodeError("Node codec: Trailing bytes after node record");
    }

    BOOST_LOG_TRIVIAL(debug) << "Node codec: Deserialized "
                             << (tag == static_cast<uint8_t>(NodeTag::File) ? "file" : "directory")
                             << " record";
    return record;
  }
  catch (const DecodeError& e) {
    BOOST_LOG_TRIVIAL(error) << "Node codec: Error during deserialization: " << e.what();
    throw;
  }
}

std::string NodeCodec::encode(const NodeRecord& record) {
  std::stringstream output;
  serialize(record, output);
  return output.str();
}

NodeRecord NodeCodec::decode(const std::string& bytes) {
  std::istringstream input(bytes);
  return deserialize(input);
}

//==============================================
// RECORD BODIES
//==============================================

std::size_t NodeCodec::write_file_body(std::ostream& output, const FileRecord& record) {
  std::size_t total_bytes = 0;
  total_bytes += write_metadata(output, record.metadata);
  total_bytes += write_cid(output, record.content);
  total_bytes += write_previous(output, record.previous);
  return total_bytes;
}

std::size_t NodeCodec::write_directory_body(std::ostream& output, const DirectoryRecord& record) {
  std::size_t total_bytes = 0;
  total_bytes += write_metadata(output, record.metadata);

  total_bytes += write_integer<uint32_t>(output, static_cast<uint32_t>(record.entries.size()));
  for (const auto& [name, cid] : record.entries) {
    total_bytes += write_string(output, name);
    total_bytes += write_cid(output, cid);
  }

  total_bytes += write_previous(output, record.previous);
  return total_bytes;
}

FileRecord NodeCodec::read_file_body(std::istream& input) {
  FileRecord record;
  record.metadata = read_metadata(input);
  record.content = read_cid(input);
  record.previous = read_previous(input);
  return record;
}

DirectoryRecord NodeCodec::read_directory_body(std::istream& input) {
  DirectoryRecord record;
  record.metadata = read_metadata(input);

  uint32_t count = read_length(input, "entry count");
  for (uint32_t i = 0; i < count; ++i) {
    std::string name = read_string(input);
    Cid cid = read_cid(input);
    if (!record.entries.empty() && !(record.entries.rbegin()->first < name)) {
      throw DecodeError("Node codec: Directory entries not in canonical order at '" + name + "'");
    }
    record.entries.emplace_hint(record.entries.end(), std::move(name), cid);
  }

  record.previous = read_previous(input);
  return record;
}

//==============================================
// FIELD ENCODING
//==============================================

std::size_t NodeCodec::write_string(std::ostream& output, const std::string& value) {
  std::size_t total_bytes = write_integer<uint32_t>(output, static_cast<uint32_t>(value.size()));
  write_bytes(output, value.data(), value.size());
  return total_bytes + value.size();
}

std::size_t NodeCodec::write_cid(std::ostream& output, const Cid& cid) {
  std::size_t total_bytes = write_integer<uint8_t>(output, static_cast<uint8_t>(cid.codec()));
  write_bytes(output, cid.digest().data(), cid.digest().size());
  return total_bytes + cid.digest().size();
}

std::size_t NodeCodec::write_metadata(std::ostream& output, const MetadataMap& metadata) {
  std::size_t total_bytes = write_integer<uint32_t>(output, static_cast<uint32_t>(metadata.size()));
  for (const auto& [key, value] : metadata) {
    total_bytes += write_string(output, key);
    if (const auto* integer = std::get_if<int64_t>(&value)) {
      total_bytes += write_integer<uint8_t>(output, static_cast<uint8_t>(MetadataKind::Integer));
      total_bytes += write_integer<int64_t>(output, *integer);
    } else {
      total_bytes += write_integer<uint8_t>(output, static_cast<uint8_t>(MetadataKind::String));
      total_bytes += write_string(output, std::get<std::string>(value));
    }
  }
  return total_bytes;
}

std::size_t NodeCodec::write_previous(std::ostream& output, const std::set<Cid>& previous) {
  std::size_t total_bytes = write_integer<uint32_t>(output, static_cast<uint32_t>(previous.size()));
  for (const auto& cid : previous) {
    total_bytes += write_cid(output, cid);
  }
  return total_bytes;
}

std::string NodeCodec::read_string(std::istream& input) {
  uint32_t length = read_length(input, "string length");
  std::string value(length, '\0');
  if (length > 0) {
    read_bytes(input, &value[0], length);
  }
  return value;
}

Cid NodeCodec::read_cid(std::istream& input) {
  uint8_t codec = read_integer<uint8_t>(input);
  if (!common::is_known_codec(codec)) {
    throw DecodeError("Node codec: Unknown CID codec " + std::to_string(codec));
  }

  Cid::Digest digest;
  read_bytes(input, digest.data(), digest.size());
  return Cid(static_cast<common::CodecType>(codec), digest);
}

MetadataMap NodeCodec::read_metadata(std::istream& input) {
  MetadataMap metadata;
  uint32_t count = read_length(input, "metadata count");
  for (uint32_t i = 0; i < count; ++i) {
    std::string key = read_string(input);
    uint8_t kind = read_integer<uint8_t>(input);

    MetadataValue value;
    switch (static_cast<MetadataKind>(kind)) {
      case MetadataKind::Integer:
        value = read_integer<int64_t>(input);
        break;
      case MetadataKind::String:
        value = read_string(input);
        break;
      default:
        throw DecodeError("Node codec: Unknown metadata kind " + std::to_string(kind));
    }

    if (!metadata.empty() && !(metadata.rbegin()->first < key)) {
      throw DecodeError("Node codec: Metadata keys not in canonical order at '" + key + "'");
    }
    metadata.emplace_hint(metadata.end(), std::move(key), std::move(value));
  }
  return metadata;
}

std::set<Cid> NodeCodec::read_previous(std::istream& input) {
  std::set<Cid> previous;
  uint32_t count = read_length(input, "previous count");
  for (uint32_t i = 0; i < count; ++i) {
    Cid cid = read_cid(input);
    if (!previous.empty() && !(*previous.rbegin() < cid)) {
      throw DecodeError("Node codec: Previous set not in canonical order at " + cid.to_string());
    }
    previous.insert(previous.end(), cid);
  }
  return previous;
}

uint32_t NodeCodec::read_length(std::istream& input, const char* what) {
  uint32_t length = read_integer<uint32_t>(input);
  if (length > MAX_LENGTH) {
    throw DecodeError(std::string("Node codec: Implausible ") + what + ": " + std::to_string(length));
  }
  return length;
}

//==============================================
// STREAM OPERATIONS
//==============================================

void NodeCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Node codec: Failed to write " << size << " bytes to output stream";
    throw std::runtime_error("Node codec: Failed to write to output stream");
  }
}

void NodeCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    throw DecodeError("Node codec: Truncated input, wanted " + std::to_string(size) + " bytes");
  }
}

} // namespace codec
} // namespace pubfs
