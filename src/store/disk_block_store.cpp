#include "store/disk_block_store.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace pubfs {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
DiskBlockStore::DiskBlockStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Disk block store: Initializing with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Disk block store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

common::Cid DiskBlockStore::put_block(const std::string& bytes, common::CodecType codec) {
  common::Cid cid = common::Cid::compute(codec, bytes);
  BOOST_LOG_TRIVIAL(info) << "Disk block store: Storing block: " << cid;

  std::lock_guard<std::mutex> lock(mutex_);

  std::filesystem::path block_path = get_path_for_cid(cid);

  // Same CID means same bytes, nothing to rewrite
  if (std::filesystem::exists(block_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Disk block store: Block already present: " << cid;
    return cid;
  }

  check_directory_exists(block_path.parent_path());
  BOOST_LOG_TRIVIAL(debug) << "Disk block store: Calculated block path: " << block_path.string();

  // Written under a temp name and renamed into place once complete
  std::filesystem::path temp_path = block_path;
  temp_path += ".tmp";

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Disk block store: Failed to create file: " << temp_path.string();
      throw common::BlockStoreError("Disk block store: Failed to create file: " + temp_path.string());
    }

    file.write(bytes.data(), bytes.size());
    file.flush();
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Disk block store: Failed to write block: " << cid;
      throw common::BlockStoreError("Disk block store: Failed to write block: " + cid.to_string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, block_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Disk block store: Failed to commit block " << cid << ": " << ec.message();
    std::filesystem::remove(temp_path, ec);
    throw common::BlockStoreError("Disk block store: Failed to commit block: " + cid.to_string());
  }

  BOOST_LOG_TRIVIAL(info) << "Disk block store: Successfully stored " << bytes.size() << " bytes as " << cid;
  return cid;
}

void DiskBlockStore::get_block(const common::Cid& cid, std::stringstream& output) {
  BOOST_LOG_TRIVIAL(info) << "Disk block store: Retrieving block: " << cid;

  std::lock_guard<std::mutex> lock(mutex_);

  std::filesystem::path block_path = get_path_for_cid(cid);
  verify_block_exists(block_path, cid);

  // Handle empty block case
  if (std::filesystem::file_size(block_path) == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Disk block store: Retrieved empty block: " << cid;
    return;
  }

  std::ifstream file(block_path, std::ios::binary);
  if (!file) {
    throw common::BlockStoreError("Disk block store: Failed to open file: " + block_path.string());
  }

  char buffer[4096];
  size_t total_bytes = 0;

  // Read file in chunks to handle large blocks efficiently
  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  if (!output.good()) {
    throw common::BlockStoreError("Disk block store: Failed to write to output stream");
  }

  BOOST_LOG_TRIVIAL(info) << "Disk block store: Successfully streamed " << total_bytes << " bytes for " << cid;
}

void DiskBlockStore::remove_block(const common::Cid& cid) {
  BOOST_LOG_TRIVIAL(info) << "Disk block store: Removing block: " << cid;

  std::lock_guard<std::mutex> lock(mutex_);

  std::filesystem::path block_path = get_path_for_cid(cid);
  verify_block_exists(block_path, cid);

  if (!std::filesystem::remove(block_path)) {
    BOOST_LOG_TRIVIAL(error) << "Disk block store: Failed to remove block: " << cid;
    throw common::BlockStoreError("Disk block store: Failed to remove block");
  }

  // Clean up empty shard directories up to base_path_
  auto current = block_path.parent_path();
  while (current != base_path_) {
    if (std::filesystem::is_empty(current)) {
      std::filesystem::remove(current);
      current = current.parent_path();
    } else {
      break;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Disk block store: Successfully removed block and cleaned up directories: " << cid;
}

void DiskBlockStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Disk block store: Clearing entire store at: " << base_path_;

  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(info) << "Disk block store: Store cleared successfully";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool DiskBlockStore::has_block(const common::Cid& cid) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::filesystem::path block_path = get_path_for_cid(cid);
  bool exists = std::filesystem::exists(block_path);

  BOOST_LOG_TRIVIAL(debug) << "Disk block store: Block " << cid << (exists ? " exists" : " not found")
                           << " at path: " << block_path.string();
  return exists;
}

std::uintmax_t DiskBlockStore::get_block_size(const common::Cid& cid) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::filesystem::path block_path = get_path_for_cid(cid);
  verify_block_exists(block_path, cid);

  std::uintmax_t size = std::filesystem::file_size(block_path);
  BOOST_LOG_TRIVIAL(debug) << "Disk block store: Block size for " << cid << ": " << size << " bytes";
  return size;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path DiskBlockStore::get_path_for_cid(const common::Cid& cid) const {
  const std::string hex = cid.to_string();
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hex.substr(i, 2);
  }

  path /= hex.substr(6);
  return path;
}


//==============================================
// UTILITY METHODS
//==============================================

void DiskBlockStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void DiskBlockStore::verify_block_exists(const std::filesystem::path& block_path, const common::Cid& cid) const {
  if (!std::filesystem::exists(block_path)) {
    BOOST_LOG_TRIVIAL(error) << "Disk block store: Block not found: " << block_path.string();
    throw common::BlockNotFound(cid.to_string());
  }
}

} // namespace store
} // namespace pubfs
