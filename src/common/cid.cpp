#include "common/cid.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include "common/fs_error.hpp"

namespace pubfs {
namespace common {

const char* codec_type_to_string(CodecType codec) {
  switch (codec) {
    case CodecType::Raw: return "raw";
    case CodecType::Node: return "node";
    default: return "unknown";
  }
}

bool is_known_codec(uint8_t value) {
  return value == static_cast<uint8_t>(CodecType::Raw) ||
         value == static_cast<uint8_t>(CodecType::Node);
}

//==============================================
// CONSTRUCTION
//==============================================

Cid::Cid(CodecType codec, const Digest& digest)
  : codec_(codec)
  , digest_(digest) {
}

Cid Cid::compute(CodecType codec, const std::string& bytes) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw BlockStoreError("CID: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw BlockStoreError("CID: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, bytes.data(), bytes.size())) {
    EVP_MD_CTX_free(ctx);
    throw BlockStoreError("CID: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw BlockStoreError("CID: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  if (hash_len != DIGEST_SIZE) {
    throw BlockStoreError("CID: Unexpected digest length " + std::to_string(hash_len));
  }

  Digest digest;
  std::copy(hash, hash + DIGEST_SIZE, digest.begin());

  Cid cid(codec, digest);
  BOOST_LOG_TRIVIAL(trace) << "CID: Computed " << codec_type_to_string(codec)
                           << " CID " << cid << " over " << bytes.size() << " bytes";
  return cid;
}

Cid Cid::from_string(const std::string& hex) {
  if (hex.size() != ENCODED_SIZE * 2) {
    throw std::invalid_argument("CID: Invalid length for '" + hex + "'");
  }

  auto parse_byte = [&hex](std::size_t offset) -> uint8_t {
    const std::string pair = hex.substr(offset, 2);
    if (!std::all_of(pair.begin(), pair.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); })) {
      throw std::invalid_argument("CID: Invalid hex digits in '" + hex + "'");
    }
    return static_cast<uint8_t>(std::stoul(pair, nullptr, 16));
  };

  uint8_t codec = parse_byte(0);
  if (!is_known_codec(codec)) {
    throw std::invalid_argument("CID: Unknown codec in '" + hex + "'");
  }

  Digest digest;
  for (std::size_t i = 0; i < DIGEST_SIZE; ++i) {
    digest[i] = parse_byte(2 + i * 2);
  }
  return Cid(static_cast<CodecType>(codec), digest);
}

//==============================================
// GETTERS
//==============================================

std::string Cid::to_string() const {
  std::stringstream ss;
  ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(codec_);
  for (uint8_t byte : digest_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

//==============================================
// COMPARISON
//==============================================

bool Cid::operator==(const Cid& other) const {
  return codec_ == other.codec_ && digest_ == other.digest_;
}

bool Cid::operator<(const Cid& other) const {
  if (codec_ != other.codec_) {
    return codec_ < other.codec_;
  }
  return digest_ < other.digest_;
}

std::ostream& operator<<(std::ostream& out, const Cid& cid) {
  return out << cid.to_string();
}

} // namespace common
} // namespace pubfs
