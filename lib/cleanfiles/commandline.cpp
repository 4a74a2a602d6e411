#include "commandline.hpp"
#include "errors.hpp"
#include "filesafety.hpp"
#include "filescanner.hpp"

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

CommandLine CommandLine::parse(int argc, char *argv[]) {
  CommandLine cmd;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      cmd.showHelp = true;
    } else if (arg == "-y" || arg == "--yes") {
      cmd.assumeYes = true;
    } else if (arg == "-n" || arg == "--dry-run") {
      cmd.dryRun = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        throw std::invalid_argument("Option " + arg + " needs a file name");
      }
      cmd.configPath = argv[++i];
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::invalid_argument("Unknown option: " + arg);
    } else {
      cmd.roots.emplace_back(arg);
    }
  }

  if (!cmd.showHelp && cmd.roots.size() < 2) {
    throw std::invalid_argument(
        "Expected a canonical directory and at least one source directory");
  }

  return cmd;
}

std::string CommandLine::usage(const std::string &program) {
  return "Usage: " + program +
         " [options] <canonical-dir> <source-dir> [source-dir...]\n"
         "\n"
         "Options:\n"
         "  -c, --config <file>  Settings file (default: ~/.clean_files)\n"
         "  -y, --yes            Approve every proposed action\n"
         "  -n, --dry-run        Only list the proposed actions\n"
         "  -h, --help           Show this help\n";
}

RootSelection selectRoots(const std::vector<fs::path> &given) {
  RootSelection selection;

  for (std::size_t i = 0; i < given.size(); ++i) {
    const bool canonical = (i == 0);
    std::error_code ec;
    fs::path root = fs::absolute(given[i], ec);
    if (ec) {
      root = given[i];
    }
    root = FileScanner::normalizeRoot(root);

    if (!fs::is_directory(root, ec)) {
      std::string msg = root.string() + " does not exist or is not a directory";
      if (canonical) {
        selection.errors.push_back("Canonical directory " + msg);
        continue;
      }
      selection.warnings.push_back("Skipping source: " + msg);
      continue;
    }

    // The scanner does not follow links, so a symlinked root is replaced by
    // the directory it points to
    fs::path resolved = fs::canonical(root, ec);
    if (!ec) {
      root = resolved;
    }

    auto status = FileSafety::checkRoot(root);
    if (FileSafety::isBlocked(status)) {
      selection.errors.push_back(FileSafety::getStatusMessage(status, root.string()));
      continue;
    }
    if (status != FileSafety::RootStatus::Allowed) {
      selection.warnings.push_back(FileSafety::getStatusMessage(status, root.string()));
    }

    selection.roots.push_back(root);
  }

  if (!selection.errors.empty()) {
    selection.roots.clear();
  } else if (selection.roots.size() < 2) {
    selection.errors.push_back("No usable source directory");
  }

  return selection;
}

Config loadRunConfig(fs::path path, std::vector<std::string> &warnings) {
  if (path.empty()) {
    path = ConfigLoader::defaultPath();
  }

  std::error_code ec;
  if (fs::exists(path, ec)) {
    return ConfigLoader::load(path);
  }

  Config defaults;
  warnings.push_back("Config file " + path.string() +
                     " not found, using defaults");
  try {
    ConfigLoader::save(path, defaults);
    warnings.push_back("Default settings written to " + path.string());
  } catch (const ConfigError &e) {
    warnings.push_back(e.what());
  }
  return defaults;
}
