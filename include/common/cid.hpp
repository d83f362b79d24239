#ifndef PUBFS_COMMON_CID_HPP
#define PUBFS_COMMON_CID_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace pubfs {
namespace common {

// Codec tag carried by every CID, tells what kind of block it addresses
enum class CodecType : uint8_t {
  Raw = 0x55,
  Node = 0x71
};

const char* codec_type_to_string(CodecType codec);

// Returns true if the byte is a known codec tag
bool is_known_codec(uint8_t value);

class Cid {
public:
  static constexpr std::size_t DIGEST_SIZE = 32;  // SHA-256
  static constexpr std::size_t ENCODED_SIZE = 1 + DIGEST_SIZE;

  using Digest = std::array<uint8_t, DIGEST_SIZE>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Cid() = default;
  Cid(CodecType codec, const Digest& digest);


  // ---- CONSTRUCTION ----
  // Hashes the given bytes with SHA-256 and tags the digest with codec
  static Cid compute(CodecType codec, const std::string& bytes);
  // Parses the hex form produced by to_string()
  static Cid from_string(const std::string& hex);


  // ---- GETTERS ----
  CodecType codec() const { return codec_; }
  const Digest& digest() const { return digest_; }

  // Lowercase hex of codec byte followed by digest
  std::string to_string() const;


  // ---- COMPARISON ----
  bool operator==(const Cid& other) const;
  bool operator!=(const Cid& other) const { return !(*this == other); }
  bool operator<(const Cid& other) const;

private:
  // ---- PARAMETERS ----
  CodecType codec_ = CodecType::Raw;
  Digest digest_{};
};

std::ostream& operator<<(std::ostream& out, const Cid& cid);

} // namespace common
} // namespace pubfs

namespace std {

template <>
struct hash<pubfs::common::Cid> {
  std::size_t operator()(const pubfs::common::Cid& cid) const noexcept {
    // Folds the codec and the leading digest bytes
    std::size_t result = static_cast<std::size_t>(cid.codec());
    for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
      result = (result << 8) ^ cid.digest()[i];
    }
    return result;
  }
};

} // namespace std

#endif // PUBFS_COMMON_CID_HPP
