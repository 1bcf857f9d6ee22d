// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // CLI output and early errors before the logger exists
#include <filesystem>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>          Data directory (default: ~/.watchtower)\n"
      << "  --btcnetwork=<net>        mainnet, testnet, signet or regtest (default: mainnet)\n"
      << "\n"
      << "bitcoind:\n"
      << "  --btcrpcconnect=<host>    RPC host (default: localhost)\n"
      << "  --btcrpcport=<port>       RPC port (default: 8332 mainnet, 18332 testnet,\n"
      << "                            38332 signet, 18443 regtest)\n"
      << "  --btcrpcuser=<user>       RPC user\n"
      << "  --btcrpcpassword=<pw>     RPC password\n"
      << "  --btcrpctimeout=<s>       RPC call timeout in seconds (default: 5)\n"
      << "  --btcfeedprotocol=<p>     ZMQ transport (default: tcp)\n"
      << "  --btcfeedconnect=<host>   ZMQ publisher host (default: 127.0.0.1)\n"
      << "  --btcfeedport=<port>      ZMQ publisher port (default: 28332)\n"
      << "\n"
      << "Chain monitor:\n"
      << "  --pollinginterval=<s>     Seconds between best-tip polls (default: 60)\n"
      << "  --tipwindow=<n>           Superseded tips remembered (default: 10)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>        Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                            Default: info\n"
      << "  --debug=<component>       Enable trace logging for specific component(s)\n"
      << "                            Components: chain, rpc, app, all\n"
      << "                            Can be comma-separated: --debug=chain,rpc\n"
      << "  --verbose                 Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version                 Show version information\n"
      << "  --help                    Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    watchtower::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    bool rpc_port_set = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      // --key=value
      std::string key = arg;
      std::string value;
      size_t eq = arg.find('=');
      bool has_value = eq != std::string::npos;
      if (has_value) {
        key = arg.substr(0, eq);
        value = arg.substr(eq + 1);
      }

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << watchtower::GetFullVersionString() << std::endl;
        std::cout << watchtower::GetCopyrightString() << std::endl;
        return 0;
      } else if (key == "--datadir" && has_value) {
        config.datadir = value;
      } else if (key == "--btcnetwork" && has_value) {
        if (watchtower::app::DefaultRpcPort(value) == 0) {
          std::cerr << "Error: Unknown network: " << value << std::endl;
          return 1;
        }
        config.btc_network = value;
      } else if (key == "--btcrpcconnect" && has_value) {
        config.bitcoind.host = value;
      } else if (key == "--btcrpcport" && has_value) {
        auto port_opt = watchtower::util::SafeParsePort(value);
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << value << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.bitcoind.port = *port_opt;
        rpc_port_set = true;
      } else if (key == "--btcrpcuser" && has_value) {
        config.bitcoind.user = value;
      } else if (key == "--btcrpcpassword" && has_value) {
        config.bitcoind.password = value;
      } else if (key == "--btcrpctimeout" && has_value) {
        auto timeout_opt = watchtower::util::SafeParseSeconds(value, 3600);
        if (!timeout_opt) {
          std::cerr << "Error: Invalid RPC timeout: " << value << std::endl;
          std::cerr << "Timeout must be between 1 and 3600 seconds" << std::endl;
          return 1;
        }
        config.bitcoind.timeout = *timeout_opt;
      } else if (key == "--btcfeedprotocol" && has_value) {
        config.feed.protocol = value;
      } else if (key == "--btcfeedconnect" && has_value) {
        config.feed.host = value;
      } else if (key == "--btcfeedport" && has_value) {
        auto port_opt = watchtower::util::SafeParsePort(value);
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << value << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.feed.port = *port_opt;
      } else if (key == "--pollinginterval" && has_value) {
        auto interval_opt = watchtower::util::SafeParseSeconds(value, 86400);
        if (!interval_opt) {
          std::cerr << "Error: Invalid polling interval: " << value << std::endl;
          std::cerr << "Interval must be between 1 and 86400 seconds" << std::endl;
          return 1;
        }
        config.monitor.polling_interval = *interval_opt;
      } else if (key == "--tipwindow" && has_value) {
        auto window_opt = watchtower::util::SafeParseInt(value, 1, 10000);
        if (!window_opt) {
          std::cerr << "Error: Invalid tip window: " << value << std::endl;
          std::cerr << "Window must be between 1 and 10000" << std::endl;
          return 1;
        }
        config.monitor.window_size = static_cast<size_t>(*window_opt);
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (key == "--loglevel" && has_value) {
        log_level = value;
      } else if (key == "--debug" && has_value) {
        // Comma-separated components: --debug=chain,rpc
        const std::string &components = value;
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (!rpc_port_set) {
      config.bitcoind.port = watchtower::app::DefaultRpcPort(config.btc_network);
    }

    // The file logger needs the datadir to exist
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: Cannot create data directory " << config.datadir
                << ": " << ec.message() << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "watchtower.log").string();
    watchtower::util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        watchtower::util::LogManager::SetLogLevel("trace");
      } else {
        watchtower::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Nested scope: the app must be destroyed before LogManager::Shutdown()
    {
      watchtower::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      app.wait_for_shutdown();
    }

    watchtower::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    watchtower::util::LogManager::Shutdown();
    return 1;
  }
}
