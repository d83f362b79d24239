#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "node/persisted_cid.hpp"
#include "test_utils.hpp"

using pubfs::common::Cid;
using pubfs::node::PersistedCid;

TEST(PersistedCidTest, StartsEmpty) {
  PersistedCid cell;
  EXPECT_FALSE(cell.get().has_value());
}

TEST(PersistedCidTest, SetIsWriteOnce) {
  PersistedCid cell;
  Cid first = raw_cid("first");
  Cid second = raw_cid("second");

  EXPECT_EQ(cell.set(first), first);
  EXPECT_EQ(cell.set(second), first);
  EXPECT_EQ(cell.get(), first);
}

TEST(PersistedCidTest, InitRunsOnlyOnce) {
  PersistedCid cell;
  int calls = 0;

  Cid cid = raw_cid("value");
  EXPECT_EQ(cell.get_or_try_init([&]() { ++calls; return cid; }), cid);
  EXPECT_EQ(cell.get_or_try_init([&]() { ++calls; return raw_cid("other"); }), cid);
  EXPECT_EQ(calls, 1);
}

TEST(PersistedCidTest, FailedInitLeavesCellEmpty) {
  PersistedCid cell;

  EXPECT_THROW(cell.get_or_try_init([]() -> Cid { throw std::runtime_error("store failed"); }),
               std::runtime_error);
  EXPECT_FALSE(cell.get().has_value());

  Cid cid = raw_cid("retry");
  EXPECT_EQ(cell.get_or_try_init([&]() { return cid; }), cid);
}

TEST(PersistedCidTest, CopiesAreEmpty) {
  PersistedCid cell;
  cell.set(raw_cid("persisted"));

  PersistedCid copy(cell);
  EXPECT_FALSE(copy.get().has_value());

  PersistedCid assigned;
  assigned = cell;
  EXPECT_FALSE(assigned.get().has_value());
  EXPECT_TRUE(cell.get().has_value());
}

TEST(PersistedCidTest, ConcurrentInitObservesSingleValue) {
  PersistedCid cell;
  std::atomic<int> calls{0};
  std::vector<Cid> results(8);
  std::vector<std::thread> threads;

  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i]() {
      results[i] = cell.get_or_try_init([&, i]() {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return raw_cid("thread " + std::to_string(i));
      });
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(calls, 1);
  for (const auto& result : results) {
    EXPECT_EQ(result, *cell.get());
  }
}
