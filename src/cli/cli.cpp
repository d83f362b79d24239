#include "cli/cli.hpp"
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "node/public_directory.hpp"
#include "node/public_file.hpp"
#include "node/public_node.hpp"

namespace pubfs {
namespace cli {

using node::PublicDirectory;
using node::PublicFile;
using node::PublicLink;
using node::PublicNode;

namespace {

std::string format_time(const std::optional<node::TimePoint>& time) {
  if (!time) {
    return "-";
  }
  std::time_t t = node::Clock::to_time_t(*time);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
  return ss.str();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::BlockStore& store, std::istream& input, std::ostream& output)
  : running_(false)
  , store_(store)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "PUBFS> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = process_line(line);
    if (running_) {
      output_ << "PUBFS> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::process_line(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args{std::istream_iterator<std::string>(iss), std::istream_iterator<std::string>()};
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else if (command == "put" && args.size() == 1) {
    handle_put_command(args[0]);
  }
  else if (command == "mkdir" && args.empty()) {
    handle_mkdir_command();
  }
  else if (command == "link" && args.size() == 3) {
    handle_link_command(args[0], args[1], args[2]);
  }
  else if (command == "unlink" && args.size() == 2) {
    handle_unlink_command(args[0], args[1]);
  }
  else if (command == "touch" && args.size() == 1) {
    handle_touch_command(args[0]);
  }
  else if (command == "stat" && args.size() == 1) {
    handle_stat_command(args[0]);
  }
  else if (command == "cat" && args.size() == 1) {
    handle_cat_command(args[0]);
  }
  else if (command == "log" && args.size() == 1) {
    handle_log_command(args[0]);
  }
  else {
    output_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_put_command(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << path << std::endl;
    return;
  }

  try {
    std::string bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    common::Cid content_cid = store_.put_block(bytes, common::CodecType::Raw);

    PublicNode file_node(PublicFile(node::Clock::now(), content_cid));
    output_ << file_node.store(store_) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_mkdir_command() {
  try {
    PublicNode dir_node(PublicDirectory(node::Clock::now()));
    output_ << dir_node.store(store_) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error creating directory", e.what());
  }
}

void CLI::handle_link_command(const std::string& dir_cid, const std::string& name, const std::string& child_cid) {
  common::Cid parent;
  common::Cid child;
  if (!parse_cid(dir_cid, parent) || !parse_cid(child_cid, child)) {
    return;
  }

  try {
    // Child must be a node already in the store
    PublicNode::load(child, store_);

    PublicDirectory next = *PublicNode::load(parent, store_).as_dir();
    next.insert_entry(name, PublicLink(child));

    PublicNode updated = PublicNode(std::move(next)).update_previous({parent});
    updated.upsert_mtime(node::Clock::now());
    output_ << updated.store(store_) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error linking entry", e.what());
  }
}

void CLI::handle_unlink_command(const std::string& dir_cid, const std::string& name) {
  common::Cid parent;
  if (!parse_cid(dir_cid, parent)) {
    return;
  }

  try {
    PublicDirectory next = *PublicNode::load(parent, store_).as_dir();
    if (!next.remove_entry(name)) {
      output_ << "No such entry: " << name << std::endl;
      return;
    }

    PublicNode updated = PublicNode(std::move(next)).update_previous({parent});
    updated.upsert_mtime(node::Clock::now());
    output_ << updated.store(store_) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error unlinking entry", e.what());
  }
}

void CLI::handle_touch_command(const std::string& cid_text) {
  common::Cid cid;
  if (!parse_cid(cid_text, cid)) {
    return;
  }

  try {
    PublicNode revision = PublicNode::load(cid, store_);
    revision.prepare_next_revision();
    revision.upsert_mtime(node::Clock::now());
    output_ << revision.store(store_) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error touching node", e.what());
  }
}

void CLI::handle_stat_command(const std::string& cid_text) {
  common::Cid cid;
  if (!parse_cid(cid_text, cid)) {
    return;
  }

  try {
    PublicNode loaded = PublicNode::load(cid, store_);
    const node::Metadata& metadata = loaded.get_metadata();

    output_ << "Type:     " << (loaded.is_dir() ? "directory" : "file") << std::endl;
    output_ << "Created:  " << format_time(metadata.get_created()) << std::endl;
    output_ << "Modified: " << format_time(metadata.get_modified()) << std::endl;

    if (loaded.is_file()) {
      output_ << "Content:  " << loaded.as_file()->get_content_cid() << std::endl;
    } else {
      const auto dir = loaded.as_dir();
      output_ << "Entries:  " << dir->get_entries().size() << std::endl;
      for (const auto& [name, link] : dir->get_entries()) {
        output_ << "  " << name << " -> " << *link.get_cid() << std::endl;
      }
    }

    output_ << "Previous: " << loaded.get_previous().size() << std::endl;
    for (const auto& previous : loaded.get_previous()) {
      output_ << "  " << previous << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error reading node", e.what());
  }
}

void CLI::handle_cat_command(const std::string& cid_text) {
  common::Cid cid;
  if (!parse_cid(cid_text, cid)) {
    return;
  }

  try {
    auto file = PublicNode::load(cid, store_).as_file();
    std::stringstream content;
    store_.get_block(file->get_content_cid(), content);
    output_ << content.str() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

// Walks the version history breadth first, each revision printed once
void CLI::handle_log_command(const std::string& cid_text) {
  common::Cid cid;
  if (!parse_cid(cid_text, cid)) {
    return;
  }

  try {
    std::deque<common::Cid> pending{cid};
    std::set<common::Cid> seen{cid};

    while (!pending.empty()) {
      common::Cid current = pending.front();
      pending.pop_front();

      PublicNode revision = PublicNode::load(current, store_);
      output_ << current << "  " << format_time(revision.get_metadata().get_modified()) << std::endl;

      for (const auto& previous : revision.get_previous()) {
        if (seen.insert(previous).second) {
          pending.push_back(previous);
        }
      }
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error reading history", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                        Display this help message" << std::endl;
  output_ << "  put <path>                  Store local file <path> as a file node" << std::endl;
  output_ << "  mkdir                       Store a new empty directory node" << std::endl;
  output_ << "  link <dir> <name> <child>   Add entry <name> -> <child> to directory <dir>" << std::endl;
  output_ << "  unlink <dir> <name>         Remove entry <name> from directory <dir>" << std::endl;
  output_ << "  touch <cid>                 Store a new revision with the current mtime" << std::endl;
  output_ << "  stat <cid>                  Show a node's metadata, entries and history" << std::endl;
  output_ << "  cat <cid>                   Print the content of a file node" << std::endl;
  output_ << "  log <cid>                   List all earlier revisions of a node" << std::endl;
  output_ << "  quit                        Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

bool CLI::parse_cid(const std::string& text, common::Cid& cid) {
  try {
    cid = common::Cid::from_string(text);
    return true;
  } catch (const std::invalid_argument& e) {
    log_and_display_error("Invalid CID", e.what());
    return false;
  }
}

} // namespace cli
} // namespace pubfs
