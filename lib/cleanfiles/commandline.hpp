/**
 * @file commandline.hpp
 * @brief Argument parsing and run setup shared by both front-ends
 */

#ifndef COMMANDLINE_HPP
#define COMMANDLINE_HPP

#include "config.hpp"

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Parsed command line
 *
 * Syntax: `<program> [options] <canonical-dir> <source-dir> [source-dir...]`
 */
struct CommandLine {
  std::filesystem::path configPath;
  bool assumeYes = false;
  bool dryRun = false;
  bool showHelp = false;
  /** @brief As given; roots[0] is the canonical directory */
  std::vector<std::filesystem::path> roots;

  /**
   * @throws std::invalid_argument on unknown options, a missing option value
   *         or fewer than two directories (unless --help was given)
   */
  static CommandLine parse(int argc, char *argv[]);

  static std::string usage(const std::string &program);
};

/**
 * @brief Roots that passed validation, plus what to tell the user
 */
struct RootSelection {
  /** @brief Absolute, normalized; [0] is canonical. Empty if a root was refused */
  std::vector<std::filesystem::path> roots;
  std::vector<std::string> warnings;
  std::vector<std::string> errors;

  bool ok() const { return errors.empty() && roots.size() >= 2; }
};

/**
 * @brief Validates the roots of a run
 *
 * The canonical directory must exist and be a directory. A source directory
 * that is missing or not a directory is skipped with a warning. Kept roots
 * are resolved to their real path, so a symlink to a directory is scanned as
 * that directory. Every kept root goes through FileSafety::checkRoot(): a blocked root is an error,
 * other findings are warnings.
 */
RootSelection selectRoots(const std::vector<std::filesystem::path> &given);

/**
 * @brief Loads the settings of a run
 *
 * When @p path does not exist the defaults are used, a warning is added and
 * a default file is written there for the user to edit.
 *
 * @param path Config file; ConfigLoader::defaultPath() when empty
 * @param warnings Receives non-fatal messages
 * @throws ConfigError if the file exists but is malformed
 */
Config loadRunConfig(std::filesystem::path path,
                     std::vector<std::string> &warnings);

#endif // COMMANDLINE_HPP
