#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/exit_codes.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using schemaflow::cli::kExitOk;
using schemaflow::cli::kExitUsage;

static std::atomic<bool> g_cancel{false};

void HandleSignal(int) {
  g_cancel.store(true);
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  schemaflow --config <config.yaml> upgrade [target=head]\n"
            << "  schemaflow --config <config.yaml> downgrade <target>\n"
            << "  schemaflow --config <config.yaml> stamp <target>\n"
            << "  schemaflow --config <config.yaml> history\n"
            << "  schemaflow --config <config.yaml> current\n"
            << "  schemaflow --config <config.yaml> heads\n"
            << "  schemaflow --config <config.yaml> check\n"
            << "\n"
            << "targets: head | base | <id> | <id prefix> | +N | -N\n";
}

static std::string Join(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ",";
    out += id;
  }
  return out;
}

static void PrintReport(const schemaflow::engine::RunReport& report) {
  if (report.units.empty()) {
    std::cout << "nothing to do\n";
    return;
  }
  for (const auto& unit : report.units) {
    std::size_t executed = 0;
    for (const auto& op : unit.operations) {
      if (op.executed) ++executed;
    }
    std::cout << schemaflow::model::DirectionName(unit.direction) << " " << unit.unit_id << " " << schemaflow::model::UnitStateName(unit.state) << " ("
              << executed << " executed, " << unit.operations.size() - executed << " already satisfied)\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = schemaflow::config::ConfigLoader::LoadFromYaml(config_path);

    schemaflow::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build migrator (dependency graph)
    // ------------------------------------------------------------
    auto migrator = schemaflow::factory::BuildMigrator(config);

    // Cancellation takes effect between units, never inside a transaction.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (cmd == "upgrade" && args.size() <= 1) {
      PrintReport(migrator->Upgrade(args.empty() ? "head" : args[0], &g_cancel));
    } else if (cmd == "downgrade" && args.size() == 1) {
      PrintReport(migrator->Downgrade(args[0], &g_cancel));
    } else if (cmd == "stamp" && args.size() == 1) {
      migrator->Stamp(args[0]);
    } else if (cmd == "history" && args.empty()) {
      for (const auto& entry : migrator->History()) {
        std::cout << entry.seq << "  " << schemaflow::util::FormatIso8601(entry.applied_at) << "  " << entry.direction << "  "
                  << (entry.version_id.empty() ? "base" : entry.version_id) << "  -> " << (entry.heads.empty() ? "base" : Join(entry.heads))
                  << "\n";
      }
    } else if (cmd == "current" && args.empty()) {
      const auto current = migrator->Current();
      if (current.empty()) std::cout << "base\n";
      for (const auto& id : current) std::cout << id << "\n";
    } else if (cmd == "heads" && args.empty()) {
      for (const auto& id : migrator->Heads()) std::cout << id << "\n";
    } else if (cmd == "check" && args.empty()) {
      const auto report = migrator->Check();
      std::cout << "units: " << report.units << "\n"
                << "roots: " << Join(report.roots) << "\n"
                << "heads: " << Join(report.heads) << "\n";
    } else {
      Usage();
      schemaflow::observability::ShutdownLogging();
      return kExitUsage;
    }

    schemaflow::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    schemaflow::observability::ShutdownLogging();
    return schemaflow::cli::ToExitCode(e);
  }

  return kExitOk;
}
