#include "node/metadata.hpp"

namespace pubfs {
namespace node {

int64_t to_unix_seconds(TimePoint time) {
  return std::chrono::floor<std::chrono::seconds>(time).time_since_epoch().count();
}

std::optional<TimePoint> from_unix_seconds(int64_t seconds) {
  using Seconds = std::chrono::seconds;
  constexpr int64_t max_seconds =
    std::chrono::duration_cast<Seconds>(TimePoint::duration::max()).count();
  constexpr int64_t min_seconds =
    std::chrono::duration_cast<Seconds>(TimePoint::duration::min()).count();

  if (seconds > max_seconds || seconds < min_seconds) {
    return std::nullopt;
  }
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(Seconds(seconds)));
}

Metadata::Metadata(TimePoint time) {
  const int64_t seconds = to_unix_seconds(time);
  entries_[CREATED_KEY] = seconds;
  entries_[MODIFIED_KEY] = seconds;
}

Metadata::Metadata(codec::MetadataMap entries)
  : entries_(std::move(entries)) {
}

void Metadata::upsert_mtime(TimePoint time) {
  entries_[MODIFIED_KEY] = to_unix_seconds(time);
}

std::optional<TimePoint> Metadata::get_created() const {
  return get_timestamp(CREATED_KEY);
}

std::optional<TimePoint> Metadata::get_modified() const {
  return get_timestamp(MODIFIED_KEY);
}

void Metadata::put(const std::string& key, codec::MetadataValue value) {
  entries_[key] = std::move(value);
}

const codec::MetadataValue* Metadata::get(const std::string& key) const {
  auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

bool Metadata::remove(const std::string& key) {
  return entries_.erase(key) > 0;
}

// A timestamp stored as a string, or outside the clock's range, is treated as absent
std::optional<TimePoint> Metadata::get_timestamp(const std::string& key) const {
  const codec::MetadataValue* value = get(key);
  if (!value) {
    return std::nullopt;
  }
  if (const auto* seconds = std::get_if<int64_t>(value)) {
    return from_unix_seconds(*seconds);
  }
  return std::nullopt;
}

} // namespace node
} // namespace pubfs
