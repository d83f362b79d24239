#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>
#include "codec/node_codec.hpp"
#include "store/disk_block_store.hpp"
#include "store/memory_block_store.hpp"
#include "test_utils.hpp"

using namespace pubfs::store;
using pubfs::common::BlockNotFound;
using pubfs::common::Cid;
using pubfs::common::CodecType;
using pubfs::common::DecodeError;

//==============================================
// SHARED CONTRACT
//==============================================

enum class StoreKind { Memory, Disk };

class BlockStoreContractTest : public ::testing::TestWithParam<StoreKind> {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<BlockStore> store;

  void SetUp() override {
    init_logging();
    if (GetParam() == StoreKind::Memory) {
      store = std::make_unique<MemoryBlockStore>();
      return;
    }
    test_dir = std::filesystem::temp_directory_path() /
      ("block_store_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    store = std::make_unique<DiskBlockStore>(test_dir.string());
  }

  void TearDown() override {
    store.reset();
    if (!test_dir.empty() && std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  Cid put_and_verify(const std::string& data, CodecType codec = CodecType::Raw) {
    Cid cid = store->put_block(data, codec);
    EXPECT_TRUE(store->has_block(cid)) << "Block should exist after storing: " << cid;

    std::stringstream output;
    EXPECT_NO_THROW(store->get_block(cid, output)) << "Failed to retrieve block: " << cid;
    EXPECT_EQ(output.str(), data) << "Data mismatch for block: " << cid;
    return cid;
  }
};

TEST_P(BlockStoreContractTest, BasicOperations) {
  Cid cid = put_and_verify("Hello, Store!");
  EXPECT_EQ(cid, Cid::compute(CodecType::Raw, "Hello, Store!"));

  // Empty block
  put_and_verify("");
}

TEST_P(BlockStoreContractTest, MissingBlock) {
  Cid missing = raw_cid("never stored");
  EXPECT_FALSE(store->has_block(missing));

  std::stringstream output;
  EXPECT_THROW(store->get_block(missing, output), BlockNotFound);
}

TEST_P(BlockStoreContractTest, PutIsIdempotent) {
  Cid first = put_and_verify("same content");
  Cid second = put_and_verify("same content");
  EXPECT_EQ(first, second);
}

TEST_P(BlockStoreContractTest, LargeBlock) {
  const std::string large_data(1024 * 1024, 'X');
  put_and_verify(large_data);
}

TEST_P(BlockStoreContractTest, SerializableRoundTrip) {
  pubfs::codec::FileRecord record;
  record.metadata = {{"created", int64_t{42}}};
  record.content = raw_cid("content");

  Cid cid = store->put_serializable(record);
  EXPECT_EQ(cid.codec(), CodecType::Node);

  pubfs::codec::NodeRecord loaded = store->get_deserializable(cid);
  ASSERT_TRUE(std::holds_alternative<pubfs::codec::FileRecord>(loaded));
  EXPECT_EQ(std::get<pubfs::codec::FileRecord>(loaded).content, record.content);
}

TEST_P(BlockStoreContractTest, RawBlockIsNotDeserializable) {
  Cid cid = store->put_block(pubfs::codec::NodeCodec::encode(pubfs::codec::FileRecord{}), CodecType::Raw);
  EXPECT_THROW(store->get_deserializable(cid), DecodeError);
}

TEST_P(BlockStoreContractTest, GarbageNodeBlockIsNotDeserializable) {
  Cid cid = store->put_block("not a node", CodecType::Node);
  EXPECT_THROW(store->get_deserializable(cid), DecodeError);
}

TEST_P(BlockStoreContractTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          // Half the blocks collide across threads on purpose
          std::string data = "Data for " + std::to_string(j % 2 == 0 ? 0 : i) + "_" + std::to_string(j);
          put_and_verify(data);
          successful_ops++;
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
}

INSTANTIATE_TEST_SUITE_P(AllStores, BlockStoreContractTest,
                         ::testing::Values(StoreKind::Memory, StoreKind::Disk));

//==============================================
// MEMORY STORE
//==============================================

TEST(MemoryBlockStoreTest, CountsDistinctBlocks) {
  MemoryBlockStore store;
  store.put_block("a", CodecType::Raw);
  store.put_block("a", CodecType::Raw);
  store.put_block("a", CodecType::Node);
  store.put_block("b", CodecType::Raw);
  EXPECT_EQ(store.size(), 3u);
}

//==============================================
// DISK STORE
//==============================================

class DiskBlockStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("disk_block_store_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }
};

TEST_F(DiskBlockStoreTest, ShardedLayout) {
  DiskBlockStore store(test_dir.string());
  Cid cid = store.put_block("sharded", CodecType::Raw);

  const std::string hex = cid.to_string();
  std::filesystem::path expected = test_dir / hex.substr(0, 2) / hex.substr(2, 2) / hex.substr(4, 2) / hex.substr(6);
  EXPECT_TRUE(std::filesystem::exists(expected));
  EXPECT_EQ(store.get_block_size(cid), std::string("sharded").size());
}

TEST_F(DiskBlockStoreTest, BlocksSurviveReopen) {
  Cid cid;
  {
    DiskBlockStore store(test_dir.string());
    cid = store.put_block("persistent", CodecType::Raw);
  }

  DiskBlockStore reopened(test_dir.string());
  std::stringstream output;
  reopened.get_block(cid, output);
  EXPECT_EQ(output.str(), "persistent");
}

TEST_F(DiskBlockStoreTest, RemoveBlockPrunesDirectories) {
  DiskBlockStore store(test_dir.string());
  Cid cid = store.put_block("short lived", CodecType::Raw);

  store.remove_block(cid);
  EXPECT_FALSE(store.has_block(cid));
  EXPECT_TRUE(std::filesystem::is_empty(test_dir));
  EXPECT_THROW(store.remove_block(cid), BlockNotFound);
}

TEST_F(DiskBlockStoreTest, ClearRemovesEverything) {
  DiskBlockStore store(test_dir.string());
  Cid first = store.put_block("one", CodecType::Raw);
  Cid second = store.put_block("two", CodecType::Node);

  store.clear();
  EXPECT_FALSE(store.has_block(first));
  EXPECT_FALSE(store.has_block(second));
  EXPECT_TRUE(std::filesystem::exists(test_dir));
}
