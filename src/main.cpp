#include <iostream>
#include <string>
#include <unordered_map>
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/disk_block_store.hpp"

struct ProgramOptions {
  std::string store_path;
  std::string log_name{"pubfs"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -s <store_dir> [-l <log_name>]\n"
        << "Required arguments:\n"
        << "  -s, --store   Block store directory\n"
        << "Optional arguments:\n"
        << "  -l, --log     Log file name under logs/ (default: pubfs)\n"
        << "Example: " << program_name << " -s ./blocks -l node1\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string ProgramOptions::*> flag_map = {
    {"-s", &ProgramOptions::store_path},
    {"--store", &ProgramOptions::store_path},
    {"-l", &ProgramOptions::log_name},
    {"--log", &ProgramOptions::log_name}
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    options.*(it->second) = value;
  }

  if (options.store_path.empty()) {
    std::cerr << "Error: Store directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    pubfs::logging::init_logging(options.log_name);
    pubfs::store::DiskBlockStore store(options.store_path);
    pubfs::cli::CLI cli(store);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
