#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "node/public_directory.hpp"
#include "node/public_file.hpp"
#include "node/public_node.hpp"
#include "test_utils.hpp"

using namespace pubfs::logging;

class LoggerTest : public ::testing::Test {
protected:
  const std::string log_name = "logger-test";

  void SetUp() override {
    std::filesystem::remove(log_path());
    pubfs::logging::init_logging(log_name, boost::log::trivial::trace);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    // Hand the core back to the console sink the other suites use
    ::init_logging();
    std::filesystem::remove(log_path());
  }

  std::filesystem::path log_path() const {
    return std::filesystem::path(LOG_DIRECTORY) / (log_name + ".log");
  }

  bool log_contains(const std::string& text) {
    boost::log::core::get()->flush();
    std::ifstream file(log_path(), std::ios::in | std::ios::binary);
    if (!file.is_open()) {
      return false;
    }
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    return content.find(text) != std::string::npos;
  }
};

TEST_F(LoggerTest, WritesToLogFile) {
  LOG_INFO << "Test info message";
  LOG_ERROR << "Test error message";

  EXPECT_TRUE(std::filesystem::exists(log_path()));
  EXPECT_TRUE(log_contains("Logger: Logging system initialized"));
  EXPECT_TRUE(log_contains("Test info message"));
  EXPECT_TRUE(log_contains("Test error message"));
  EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
  std::thread t([]() {
    LOG_INFO << "Message from thread";
  });
  t.join();

  EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(boost::log::trivial::warning);

  LOG_DEBUG << "Should not appear";
  LOG_WARN << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear"));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
  disable_logging();
  LOG_FATAL << "Should not appear";

  enable_logging();
  LOG_INFO << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear"));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, NodeStoreIsLogged) {
  pubfs::store::MemoryBlockStore store;
  pubfs::node::PublicNode file(pubfs::node::PublicFile(test_time(), raw_cid("logged")));

  pubfs::common::Cid cid = file.store(store);

  EXPECT_TRUE(log_contains("Public file: Stored file as " + cid.to_string()));
}

TEST_F(LoggerTest, CastFailuresAreLoggedAsErrors) {
  set_log_level(boost::log::trivial::error);
  pubfs::node::PublicNode file(pubfs::node::PublicFile(test_time(), raw_cid("not a dir")));
  pubfs::node::PublicNode dir{pubfs::node::PublicDirectory(test_time())};

  EXPECT_THROW(file.as_dir(), pubfs::common::NotADirectory);
  EXPECT_THROW(dir.as_file(), pubfs::common::NotAFile);

  EXPECT_TRUE(log_contains("Public node: Node " + file.get_id() + " is not a directory"));
  EXPECT_TRUE(log_contains("Public node: Node " + dir.get_id() + " is not a file"));
}
