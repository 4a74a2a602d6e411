/**
 * @file config.hpp
 * @brief Run settings and the .clean_files loader
 *
 * The settings file is INI-style:
 * @code
 * [Settings]
 * suggested_permissions = rw-r--r--
 * troublesome_chars = :;*?"$#`|\\.
 * char_substitute = _
 * temp_extensions = .tmp,~,.bak,.DS_Store
 * @endcode
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Settings for one run; immutable once the core starts
 */
struct Config {
  /** @brief Expected rwx bits for every file (e.g. 0644) */
  unsigned suggestedPermissions = 0644;

  /** @brief Characters that are replaced in file names */
  std::string troublesomeChars = ":;*?\"$#`|\\.";

  /** @brief Replacement for each troublesome character */
  char substitute = '_';

  /** @brief Name suffixes marking temporary files (case-sensitive) */
  std::vector<std::string> tempExtensions = {".tmp", "~", ".bak", ".DS_Store"};

  bool isTroublesome(char c) const {
    return troublesomeChars.find(c) != std::string::npos;
  }

  /**
   * @brief Returns the first configured temp suffix the name ends with
   */
  std::optional<std::string> matchTempSuffix(const std::string &name) const {
    for (const auto &suffix : tempExtensions) {
      if (!suffix.empty() && name.size() >= suffix.size() &&
          name.compare(name.size() - suffix.size(), suffix.size(), suffix) ==
              0) {
        return suffix;
      }
    }
    return std::nullopt;
  }
};

/**
 * @brief Reads, validates and writes the settings file
 *
 * All parse and validation problems raise ConfigError with the offending
 * line or key in the message.
 */
class ConfigLoader {
public:
  /** @brief $HOME/.clean_files (or ./.clean_files when HOME is unset) */
  static std::filesystem::path defaultPath();

  /**
   * @brief Loads settings from a file
   * @throws ConfigError if the file cannot be read or is malformed
   */
  static Config load(const std::filesystem::path &path);

  /**
   * @brief Parses settings text; keys missing from the text keep defaults
   * @throws ConfigError
   */
  static Config parse(const std::string &text);

  /** @brief Writes the settings in canonical form. @throws ConfigError */
  static void save(const std::filesystem::path &path, const Config &config);

  /** @brief Renders the settings in the file format parse() accepts */
  static std::string serialize(const Config &config);

  /**
   * @brief Accepts "rw-r--r--" or "644"
   * @throws ConfigError
   */
  static unsigned parsePermissions(const std::string &text);

  /** @brief 0644 -> "rw-r--r--" */
  static std::string formatPermissions(unsigned bits);

  /**
   * @brief Resolves backslash escapes ("\\" -> "\", "\x" -> "x")
   * @throws ConfigError on a trailing lone backslash
   */
  static std::string unescape(const std::string &text);

  static std::string escape(const std::string &text);

private:
  static void validate(const Config &config);
};

#endif // CONFIG_HPP
