#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include "bumplog/changelog.h"
#include "bumplog/error.h"

int main(int argc, char* argv[]) {
  argparse::ArgumentParser program("bumplog", BUMPLOG_VERSION);

  program.add_argument("path")
      .default_value(std::string{"."})
      .help("Path to git repository");

  program.add_argument("-f", "--from")
      .help("Tag or commit to start after (default: latest tag reachable from HEAD)");

  program.add_argument("-t", "--to")
      .default_value(std::string{"HEAD"})
      .help("Tag or commit to end at");

  program.add_argument("-p", "--prefix")
      .default_value(std::string{"v"})
      .help("Prefix of version tags");

  program.add_argument("-r", "--remote")
      .default_value(std::string{"origin"})
      .help("Remote used to build compare and commit links");

  program.add_argument("-u", "--url")
      .default_value(std::string())
      .help(
          "Remote repository URL (e.g., "
          "https://github.com/owner/repo); overrides --remote");

  program.add_argument("-o", "--output")
      .default_value(std::string())
      .help("Changelog file to prepend to (default: print to stdout)");

  program.add_argument("-b", "--bump")
      .choices("major", "minor", "patch")
      .help("Override the computed version bump of the newest release");

  program.add_argument("--no-emoji")
      .default_value(false)
      .implicit_value(true)
      .help("Plain section titles");

  program.add_argument("--offline")
      .default_value(false)
      .implicit_value(true)
      .help("Do not look up contributor handles");

  program.add_argument("--no-gh")
      .default_value(false)
      .implicit_value(true)
      .help("Do not read GitHub commit history through the gh CLI");

  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable verbose logging");

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    spdlog::error("{}", err.what());
    std::cerr << program;
    return EXIT_FAILURE;
  }

  if (program.get<bool>("--verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  bumplog::Changelog::Config config;
  config.repo = program.get<std::string>("path");
  if (auto from = program.present<std::string>("--from")) {
    config.from = *from;
  }
  config.to = program.get<std::string>("--to");
  config.prefix = program.get<std::string>("--prefix");
  config.remote = program.get<std::string>("--remote");
  config.url = program.get<std::string>("--url");
  config.output = program.get<std::string>("--output");
  if (auto bump = program.present<std::string>("--bump")) {
    config.bump = bumplog::ParseBumpLevel(*bump);
  }
  config.use_emoji = !program.get<bool>("--no-emoji");
  config.lookup = !program.get<bool>("--offline");
  config.use_gh = !program.get<bool>("--no-gh") && config.lookup;

  try {
    bumplog::Changelog changelog(std::move(config));
    changelog.Generate();
  } catch (const bumplog::Error& err) {
    spdlog::error("Failed to generate changelog ({}): {}", bumplog::ErrorKindName(err.kind()),
                  err.what());
    return EXIT_FAILURE;
  } catch (const std::exception& err) {
    spdlog::error("Failed to generate changelog: {}", err.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
