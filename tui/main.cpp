#include "cleanfilesui.hpp"
#include "commandline.hpp"
#include "errors.hpp"
#include "localfilesystem.hpp"
#include "sha256hasher.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

int main(int argc, char *argv[]) {
  std::string program = argc > 0
                            ? std::filesystem::path(argv[0]).filename().string()
                            : "cleanfiles-tui";

  CommandLine cmd;
  try {
    cmd = CommandLine::parse(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "✗ " << e.what() << "\n\n" << CommandLine::usage(program);
    return 1;
  }

  if (cmd.showHelp) {
    std::cout << CommandLine::usage(program);
    return 0;
  }

  std::vector<std::string> warnings;
  Config config;
  try {
    config = loadRunConfig(cmd.configPath, warnings);
  } catch (const ConfigError &e) {
    std::cerr << "✗ Configuration error: " << e.what() << std::endl;
    return 2;
  }

  RootSelection selection = selectRoots(cmd.roots);
  warnings.insert(warnings.end(), selection.warnings.begin(),
                  selection.warnings.end());
  for (const auto &w : warnings) {
    std::cerr << "⚠️ " << w << std::endl;
  }
  if (!selection.ok()) {
    for (const auto &error : selection.errors) {
      std::cerr << "✗ " << error << std::endl;
    }
    return 1;
  }

  LocalFileSystem fs;
  Sha256Hasher hasher(fs);
  CleanRun run(fs, hasher, config, selection.roots);

  try {
    CleanFilesUI ui(run, cmd.assumeYes, cmd.dryRun);
    ui.initialize();
    ui.run();
    return ui.exitCode();
  } catch (const std::exception &e) {
    // Terminal is already restored by the screen's destructor
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
