#ifndef PUBFS_NODE_METADATA_HPP
#define PUBFS_NODE_METADATA_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "codec/node_record.hpp"

namespace pubfs {
namespace node {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Node metadata: an ordered map of named values. Timestamps are kept as
// whole unix seconds under "created" and "modified".
class Metadata {
public:
  static constexpr const char* CREATED_KEY = "created";
  static constexpr const char* MODIFIED_KEY = "modified";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Sets both created and modified to time
  explicit Metadata(TimePoint time);
  explicit Metadata(codec::MetadataMap entries);


  // ---- TIMESTAMPS ----
  // Sets the modified time, inserting it if missing
  void upsert_mtime(TimePoint time);
  std::optional<TimePoint> get_created() const;
  std::optional<TimePoint> get_modified() const;


  // ---- ENTRIES ----
  void put(const std::string& key, codec::MetadataValue value);
  const codec::MetadataValue* get(const std::string& key) const;
  bool remove(const std::string& key);
  const codec::MetadataMap& entries() const { return entries_; }


  bool operator==(const Metadata& other) const { return entries_ == other.entries_; }
  bool operator!=(const Metadata& other) const { return !(*this == other); }

private:
  // ---- PARAMETERS ----
  codec::MetadataMap entries_;

  std::optional<TimePoint> get_timestamp(const std::string& key) const;
};

// Rounds a time point down to whole seconds since the epoch
int64_t to_unix_seconds(TimePoint time);
// Empty if seconds does not fit the clock's duration
std::optional<TimePoint> from_unix_seconds(int64_t seconds);

} // namespace node
} // namespace pubfs

#endif // PUBFS_NODE_METADATA_HPP
