#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "common/cid.hpp"
#include "store/block_store.hpp"

namespace pubfs {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CLI(store::BlockStore& store, std::istream& input = std::cin, std::ostream& output = std::cout);


  // ---- STARTUP ----
  void run();

  // Executes one command line, returns false once the shell should exit
  bool process_line(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  // System components
  store::BlockStore& store_;
  std::istream& input_;
  std::ostream& output_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_put_command(const std::string& path);
  void handle_mkdir_command();
  void handle_link_command(const std::string& dir_cid, const std::string& name, const std::string& child_cid);
  void handle_unlink_command(const std::string& dir_cid, const std::string& name);
  void handle_touch_command(const std::string& cid);
  void handle_stat_command(const std::string& cid);
  void handle_cat_command(const std::string& cid);
  void handle_log_command(const std::string& cid);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);

  // Parses a CID argument, reporting failure to the user
  bool parse_cid(const std::string& text, common::Cid& cid);
};

} // namespace cli
} // namespace pubfs
