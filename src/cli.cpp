// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "network/rpc_client.hpp"
#include "util/files.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

void PrintUsage(const char *program_name) {
  std::cout
      << "Watchtower CLI - Query a running watchtowerd\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.watchtower)\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "  gettowerinfo         Monitor phase, best tip and consumer checkpoints\n"
      << "  getbestblockhash     Most recent tip seen by the monitor\n"
      << "  getlasttips          Recently superseded tips\n"
      << "  stop                 Stop watchtowerd\n"
      << "  help                 List commands supported by the daemon\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    std::filesystem::path datadir = watchtower::util::get_default_datadir();
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << watchtower::GetFullVersionString() << std::endl;
        std::cout << watchtower::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        datadir = arg.substr(10);
      } else if (command.empty()) {
        command = arg;
      } else {
        params.push_back(arg);
      }
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    watchtower::rpc::RPCClient client((datadir / "watchtower.sock").string());
    if (!client.Ping()) {
      std::cerr << "Error: Cannot connect to watchtowerd at "
                << client.socket_path() << "\n"
                << "Make sure watchtowerd is running.\n";
      return 1;
    }

    nlohmann::json reply = client.Call(command, params);
    if (reply.is_object() && reply.contains("error")) {
      std::cerr << "Error: " << reply["error"].get<std::string>() << std::endl;
      return 1;
    }
    if (reply.is_string()) {
      std::cout << reply.get<std::string>() << std::endl;
    } else {
      std::cout << reply.dump(2) << std::endl;
    }
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
