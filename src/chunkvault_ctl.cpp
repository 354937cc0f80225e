#include "chunkvault/pipeline/storage_pipeline.hpp"
#include "chunkvault/utilities/logger.h"

#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace chunkvault;

namespace {

void printUsage() {
  std::cout << "Usage: chunkvault_ctl [--config <file>] <command> [options]\n"
            << "  store <file> [--no-dedup] [--no-compress] [--no-replicate]\n"
            << "  collect <dir> [--no-categorize] [--no-dedup] "
               "[--no-compress]\n"
            << "  search [--name <text>] [--category <name>]\n"
            << "  stats\n";
}

bool hasFlag(const std::set<std::string> &flags, const std::string &flag) {
  return flags.count(flag) != 0;
}

void initLogging(const PipelineConfig &config) {
  const LogLevel level = Logger::levelFromString(config.logLevel);
  if (config.logFile.empty()) {
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, level);
  } else {
    Logger::init(config.logFile, level);
  }
}

std::string catalogPath(const PipelineConfig &config) {
  return (std::filesystem::path(config.basePath) / "metadata" /
          "catalog.json")
      .string();
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string configPath;
  if (args.size() >= 2 && args[0] == "--config") {
    configPath = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    printUsage();
    return 1;
  }

  PipelineConfig config;
  try {
    config = loadPipelineConfig(configPath);
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  }
  initLogging(config);

  const std::string cmd = args[0];
  std::set<std::string> flags;
  std::vector<std::string> positional;
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i].rfind("--", 0) == 0)
      flags.insert(args[i]);
    else
      positional.push_back(args[i]);
  }

  try {
    StoragePipeline pipeline(config);

    if (cmd == "store" && positional.size() == 1) {
      PipelineRecord record = pipeline.storeFile(
          positional[0], !hasFlag(flags, "--no-dedup"),
          !hasFlag(flags, "--no-compress"), !hasFlag(flags, "--no-replicate"));
      std::cout << toJson(record).dump(2) << std::endl;
      return record.ok() ? 0 : 1;
    } else if (cmd == "collect" && positional.size() == 1) {
      CollectionStats stats = pipeline.smartCollection(
          positional[0], !hasFlag(flags, "--no-categorize"),
          !hasFlag(flags, "--no-dedup"), !hasFlag(flags, "--no-compress"));
      if (!pipeline.cataloger().saveCatalog(catalogPath(config))) {
        std::cerr << "Failed to save catalog" << std::endl;
        return 1;
      }
      std::cout << toJson(stats).dump(2) << std::endl;
      return stats.errors == 0 ? 0 : 1;
    } else if (cmd == "search") {
      // Query options take a value, so parse them from the raw argument list.
      CatalogQuery query;
      for (size_t i = 1; i + 1 < args.size(); ++i) {
        if (args[i] == "--name")
          query.nameContains = args[i + 1];
        else if (args[i] == "--category")
          query.category = args[i + 1];
      }
      pipeline.cataloger().collectAndOrganize(
          pipeline.cataloger().basePath(), false);
      nlohmann::json results = nlohmann::json::array();
      for (const auto &entry : pipeline.cataloger().search(query)) {
        results.push_back(toJson(entry));
      }
      std::cout << results.dump(2) << std::endl;
      return 0;
    } else if (cmd == "stats") {
      // Each invocation starts with an empty registry, so report the vault.
      std::cout << toJson(pipeline.inventory()).dump(2) << std::endl;
      return 0;
    }
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::FATAL, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  printUsage();
  return 1;
}
