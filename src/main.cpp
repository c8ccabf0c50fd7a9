// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "chain/chainparams.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Runs a validator cluster behind a message-dropping proxy and exits 0\n"
      << "once a block at the target height has crossed a link.\n"
      << "\n"
      << "Harness:\n"
      << "  --timeout=<sec>            Liveness deadline (default: 90)\n"
      << "  --poll-interval-ms=<ms>    Driver poll interval (default: 1000)\n"
      << "  --drop-ratio=<p>           Probability of dropping a message, 0..1 (default: 0.05)\n"
      << "  --height-target=<h>        Height that counts as success (default: 10)\n"
      << "  --seed=<n>                 Seed the per-link drop streams (default: random)\n"
      << "  --shared-gate=<name>       Keep the liveness gate in named shared memory\n"
      << "  --proxy-threads=<n>        Proxy interception threads (default: 2)\n"
      << "\n"
      << "Cluster:\n"
      << "  --nodes=<n>                Number of validator nodes (default: 4)\n"
      << "  --shards=<n>               Number of shards, 0 = single shard (default: 0)\n"
      << "  --boot-node=<i>            Boot node index (default: 1)\n"
      << "  --config=<file>            JSON merged into every node's config\n"
      << "  --node-config=<i>:<file>   JSON merged into node i's config (repeatable)\n"
      << "  --genesis=<ptr>=<json>     Genesis override, e.g. --genesis=/epoch_length=20\n"
      << "                             (repeatable, applied in order)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>         Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                             Default: info\n"
      << "  --debug=<component>        Enable trace logging for specific component(s)\n"
      << "                             Components: network, chain, proxy, cluster, harness, all\n"
      << "                             Can be comma-separated: --debug=proxy,harness\n"
      << "  --logfile=<path>           Also write logs to a rotating file\n"
      << "\n"
      << "Other:\n"
      << "  --version                  Show version information\n"
      << "  --help                     Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  using dropnet::util::SafeParseDouble;
  using dropnet::util::SafeParseInt;
  using dropnet::util::SafeParseInt64;
  using dropnet::util::SafeParseUInt64;
  using dropnet::util::SplitOnce;

  try {
    dropnet::app::HarnessConfig config;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << dropnet::GetFullVersionString() << std::endl;
        std::cout << dropnet::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--timeout=") == 0) {
        auto secs = SafeParseInt64(arg.substr(10), 1, 86400);
        if (!secs) {
          std::cerr << "Error: Invalid timeout: " << arg.substr(10) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 1 and 86400" << std::endl;
          return 1;
        }
        config.driver.timeout = std::chrono::seconds(*secs);
      } else if (arg.find("--poll-interval-ms=") == 0) {
        auto ms = SafeParseInt64(arg.substr(19), 1, 60000);
        if (!ms) {
          std::cerr << "Error: Invalid poll interval: " << arg.substr(19) << std::endl;
          std::cerr << "Poll interval must be between 1 and 60000 ms" << std::endl;
          return 1;
        }
        config.driver.poll_interval = std::chrono::milliseconds(*ms);
      } else if (arg.find("--drop-ratio=") == 0) {
        auto ratio = SafeParseDouble(arg.substr(13), 0.0, 1.0);
        if (!ratio) {
          std::cerr << "Error: Invalid drop ratio: " << arg.substr(13) << std::endl;
          std::cerr << "Drop ratio must be a number between 0 and 1" << std::endl;
          return 1;
        }
        config.drop.drop_ratio = *ratio;
      } else if (arg.find("--height-target=") == 0) {
        auto target = SafeParseUInt64(arg.substr(16));
        if (!target || *target == 0) {
          std::cerr << "Error: Invalid height target: " << arg.substr(16) << std::endl;
          return 1;
        }
        config.drop.height_target = *target;
      } else if (arg.find("--seed=") == 0) {
        auto seed = SafeParseUInt64(arg.substr(7));
        if (!seed) {
          std::cerr << "Error: Invalid seed: " << arg.substr(7) << std::endl;
          return 1;
        }
        config.drop.seed = *seed;
      } else if (arg.find("--shared-gate=") == 0) {
        config.shared_gate_name = arg.substr(14);
        if (config.shared_gate_name.empty()) {
          std::cerr << "Error: --shared-gate needs a segment name" << std::endl;
          return 1;
        }
      } else if (arg.find("--proxy-threads=") == 0) {
        auto threads = SafeParseInt(arg.substr(16), 1, 64);
        if (!threads) {
          std::cerr << "Error: Invalid proxy thread count: " << arg.substr(16) << std::endl;
          std::cerr << "Thread count must be between 1 and 64" << std::endl;
          return 1;
        }
        config.cluster.proxy.threads = static_cast<size_t>(*threads);
      } else if (arg.find("--nodes=") == 0) {
        auto nodes = SafeParseInt(arg.substr(8), 1, 64);
        if (!nodes) {
          std::cerr << "Error: Invalid node count: " << arg.substr(8) << std::endl;
          std::cerr << "Node count must be between 1 and 64" << std::endl;
          return 1;
        }
        config.cluster.node_count = *nodes;
      } else if (arg.find("--shards=") == 0) {
        auto shards = SafeParseInt(arg.substr(9), 0, 32);
        if (!shards) {
          std::cerr << "Error: Invalid shard count: " << arg.substr(9) << std::endl;
          std::cerr << "Shard count must be between 0 and 32" << std::endl;
          return 1;
        }
        config.cluster.shard_count = *shards;
      } else if (arg.find("--boot-node=") == 0) {
        auto boot = SafeParseInt(arg.substr(12), 0, 63);
        if (!boot) {
          std::cerr << "Error: Invalid boot node index: " << arg.substr(12) << std::endl;
          return 1;
        }
        config.cluster.boot_node_index = *boot;
      } else if (arg.find("--config=") == 0) {
        config.cluster.local_config_override =
            dropnet::chain::LoadConfigFile(arg.substr(9));
      } else if (arg.find("--node-config=") == 0) {
        auto parts = SplitOnce(arg.substr(14), ':');
        auto index = parts ? SafeParseInt(parts->first, 0, 63) : std::nullopt;
        if (!index) {
          std::cerr << "Error: Invalid node config: " << arg.substr(14) << std::endl;
          std::cerr << "Expected --node-config=<index>:<file>" << std::endl;
          return 1;
        }
        config.cluster.node_overrides[*index] =
            dropnet::chain::LoadConfigFile(parts->second);
      } else if (arg.find("--genesis=") == 0) {
        auto parts = SplitOnce(arg.substr(10), '=');
        if (!parts || parts->first.empty()) {
          std::cerr << "Error: Invalid genesis override: " << arg.substr(10) << std::endl;
          std::cerr << "Expected --genesis=<json-pointer>=<json-value>" << std::endl;
          return 1;
        }
        config.cluster.genesis_overrides.emplace_back(
            parts->first,
            dropnet::chain::ParseConfigJson(parts->second, "--genesis " + parts->first));
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=proxy,harness
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            config.debug_components.push_back(components.substr(pos));
            break;
          }
          config.debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else if (arg.find("--logfile=") == 0) {
        config.log_file = arg.substr(10);
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    dropnet::util::LogManager::Initialize(config.log_level, !config.log_file.empty(),
                                          config.log_file);

    for (const auto &component : config.debug_components) {
      if (component == "all") {
        dropnet::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        dropnet::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        dropnet::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Nested scope: the cluster's threads are joined before the logger goes away
    {
      dropnet::app::Application app(std::move(config));
      app.Run();
    }

    dropnet::util::LogManager::Shutdown();
    std::cout << "Success" << std::endl;
    return 0;

  } catch (const dropnet::harness::LivenessTimeout &e) {
    std::cerr << "Timeout: " << e.what() << std::endl;
    dropnet::util::LogManager::Shutdown();
    return 1;
  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    dropnet::util::LogManager::Shutdown();
    return 1;
  }
}
