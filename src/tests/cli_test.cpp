#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>
#include "cli/cli.hpp"
#include "node/public_directory.hpp"
#include "node/public_node.hpp"
#include "test_utils.hpp"

using pubfs::cli::CLI;
using pubfs::common::Cid;
using pubfs::node::PublicNode;

class CLITest : public ::testing::Test {
protected:
  pubfs::store::MemoryBlockStore store;
  std::istringstream input;
  std::ostringstream output;
  CLI cli{store, input, output};
  std::filesystem::path test_file;

  void SetUp() override {
    init_logging();
    test_file = std::filesystem::temp_directory_path() /
      ("cli_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".txt");
    std::ofstream(test_file) << "file from disk";
  }

  void TearDown() override {
    std::filesystem::remove(test_file);
  }

  // Runs one command and returns its output without the trailing newline
  std::string run_command(const std::string& line) {
    output.str("");
    EXPECT_TRUE(cli.process_line(line));
    std::string result = output.str();
    if (!result.empty() && result.back() == '\n') {
      result.pop_back();
    }
    return result;
  }
};

TEST_F(CLITest, PutAndCat) {
  std::string file_cid = run_command("put " + test_file.string());

  PublicNode file = PublicNode::load(Cid::from_string(file_cid), store);
  EXPECT_TRUE(file.is_file());
  EXPECT_EQ(run_command("cat " + file_cid), "file from disk");
}

TEST_F(CLITest, PutMissingFile) {
  EXPECT_EQ(run_command("put /nonexistent/pubfs/file"), "Error opening file: /nonexistent/pubfs/file");
}

TEST_F(CLITest, LinkAndUnlinkCreateRevisions) {
  std::string dir_cid = run_command("mkdir");
  std::string file_cid = run_command("put " + test_file.string());

  std::string linked_cid = run_command("link " + dir_cid + " notes.txt " + file_cid);
  PublicNode linked = PublicNode::load(Cid::from_string(linked_cid), store);
  ASSERT_TRUE(linked.is_dir());
  EXPECT_EQ(linked.as_dir()->get_entries().at("notes.txt").get_cid(), Cid::from_string(file_cid));
  EXPECT_EQ(linked.get_previous(), std::set<Cid>{Cid::from_string(dir_cid)});

  std::string unlinked_cid = run_command("unlink " + linked_cid + " notes.txt");
  PublicNode unlinked = PublicNode::load(Cid::from_string(unlinked_cid), store);
  EXPECT_TRUE(unlinked.as_dir()->get_entries().empty());

  EXPECT_EQ(run_command("unlink " + unlinked_cid + " notes.txt"), "No such entry: notes.txt");
}

TEST_F(CLITest, LinkIntoFileFails) {
  std::string file_cid = run_command("put " + test_file.string());
  std::string result = run_command("link " + file_cid + " x " + file_cid);
  EXPECT_EQ(result, "Error linking entry: Node: Not a directory");
}

TEST_F(CLITest, TouchAndLog) {
  std::string first = run_command("mkdir");
  std::string second = run_command("touch " + first);
  std::string third = run_command("touch " + second);
  EXPECT_NE(first, second);
  EXPECT_NE(second, third);

  std::istringstream history(run_command("log " + third));
  std::vector<std::string> revisions;
  std::string line;
  while (std::getline(history, line)) {
    revisions.push_back(line.substr(0, line.find(' ')));
  }
  EXPECT_EQ(revisions, (std::vector<std::string>{third, second, first}));
}

TEST_F(CLITest, StatShowsNodeType) {
  std::string dir_cid = run_command("mkdir");
  std::string result = run_command("stat " + dir_cid);

  EXPECT_NE(result.find("Type:     directory"), std::string::npos);
  EXPECT_NE(result.find("Entries:  0"), std::string::npos);
  EXPECT_NE(result.find("Previous: 0"), std::string::npos);
}

TEST_F(CLITest, ErrorCases) {
  EXPECT_EQ(run_command("frobnicate"), "Unknown command or invalid arguments");
  EXPECT_EQ(run_command("cat"), "Unknown command or invalid arguments");
  EXPECT_EQ(run_command("stat not-a-cid").rfind("Invalid CID: ", 0), 0u);
  EXPECT_EQ(run_command("stat " + raw_cid("missing").to_string()).rfind("Error reading node: ", 0), 0u);
  EXPECT_EQ(run_command(""), "");
}

TEST_F(CLITest, RunStopsAtQuit) {
  input.str("mkdir\nquit\nmkdir\n");
  cli.run();

  EXPECT_EQ(store.size(), 1u);
}
