#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() &&
         (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::vector<std::string> splitList(const std::string &value) {
  std::vector<std::string> out;
  std::istringstream iss(value);
  std::string item;
  while (std::getline(iss, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

constexpr std::string_view kSettingsSection = "settings";

} // namespace

std::filesystem::path ConfigLoader::defaultPath() {
  const char *home = std::getenv("HOME");
  std::filesystem::path base = home ? std::filesystem::path(home)
                                    : std::filesystem::current_path();
  return base / ".clean_files";
}

Config ConfigLoader::load(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("Cannot read config file: " + path.string());
  }

  std::ostringstream content;
  content << file.rdbuf();

  try {
    return parse(content.str());
  } catch (const ConfigError &e) {
    throw ConfigError(path.string() + ": " + e.what());
  }
}

Config ConfigLoader::parse(const std::string &text) {
  Config config;
  std::istringstream iss(text);
  std::string line;
  std::string section;
  int line_no = 0;

  while (std::getline(iss, line)) {
    ++line_no;
    std::string sv = trim(line);
    if (sv.empty() || sv[0] == '#' || sv[0] == ';')
      continue; // comments

    if (sv.front() == '[') {
      if (sv.back() != ']') {
        throw ConfigError("line " + std::to_string(line_no) +
                          ": unterminated section header");
      }
      section = toLower(trim(std::string_view(sv).substr(1, sv.size() - 2)));
      continue;
    }

    auto delim = sv.find_first_of("=:");
    if (delim == std::string::npos) {
      throw ConfigError("line " + std::to_string(line_no) +
                        ": expected 'key = value'");
    }

    if (section != kSettingsSection)
      continue;

    std::string key = toLower(trim(std::string_view(sv).substr(0, delim)));
    std::string value = trim(std::string_view(sv).substr(delim + 1));

    if (key == "suggested_permissions") {
      config.suggestedPermissions = parsePermissions(value);
    } else if (key == "troublesome_chars") {
      config.troublesomeChars = unescape(value);
    } else if (key == "char_substitute") {
      std::string sub = unescape(value);
      if (sub.size() != 1) {
        throw ConfigError("char_substitute must be exactly one character, got '" +
                          value + "'");
      }
      config.substitute = sub[0];
    } else if (key == "temp_extensions") {
      config.tempExtensions = splitList(value);
    }
  }

  validate(config);
  return config;
}

void ConfigLoader::validate(const Config &config) {
  if (config.substitute == '/' || config.substitute == '\0') {
    throw ConfigError("char_substitute cannot be '/' or NUL");
  }
  if (config.isTroublesome(config.substitute)) {
    throw ConfigError(std::string("char_substitute '") + config.substitute +
                      "' is itself listed in troublesome_chars");
  }
}

void ConfigLoader::save(const std::filesystem::path &path,
                        const Config &config) {
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    throw ConfigError("Cannot write config file: " + path.string());
  }
  file << serialize(config);
  if (!file) {
    throw ConfigError("Write error in config file: " + path.string());
  }
}

std::string ConfigLoader::serialize(const Config &config) {
  std::ostringstream os;
  os << "[Settings]\n";
  os << "suggested_permissions = "
     << formatPermissions(config.suggestedPermissions) << '\n';
  os << "troublesome_chars = " << escape(config.troublesomeChars) << '\n';
  os << "char_substitute = " << escape(std::string(1, config.substitute))
     << '\n';

  os << "temp_extensions = ";
  for (std::size_t i = 0; i < config.tempExtensions.size(); ++i) {
    if (i > 0)
      os << ',';
    os << config.tempExtensions[i];
  }
  os << '\n';
  return os.str();
}

unsigned ConfigLoader::parsePermissions(const std::string &text) {
  // Octal form: "644"
  if (text.size() == 3 &&
      std::all_of(text.begin(), text.end(),
                  [](char c) { return c >= '0' && c <= '7'; })) {
    return static_cast<unsigned>(std::stoul(text, nullptr, 8));
  }

  // Symbolic form: "rw-r--r--"
  if (text.size() != 9) {
    throw ConfigError("Permission string must be 9 characters (e.g. "
                      "'rw-r--r--') or 3 octal digits, got '" +
                      text + "'");
  }

  static constexpr char kLetters[3] = {'r', 'w', 'x'};
  unsigned bits = 0;
  for (std::size_t i = 0; i < 9; ++i) {
    char expected = kLetters[i % 3];
    bits <<= 1;
    if (text[i] == expected) {
      bits |= 1u;
    } else if (text[i] != '-') {
      throw ConfigError("Invalid permission character '" +
                        std::string(1, text[i]) + "' in '" + text + "'");
    }
  }
  return bits;
}

std::string ConfigLoader::formatPermissions(unsigned bits) {
  static constexpr char kLetters[3] = {'r', 'w', 'x'};
  std::string out(9, '-');
  for (std::size_t i = 0; i < 9; ++i) {
    if (bits & (1u << (8 - i))) {
      out[i] = kLetters[i % 3];
    }
  }
  return out;
}

std::string ConfigLoader::unescape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\\') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 1 == text.size()) {
      throw ConfigError("Trailing backslash in '" + text + "'");
    }
    out.push_back(text[++i]);
  }
  return out;
}

std::string ConfigLoader::escape(const std::string &text) {
  std::string out;
  out.reserve(text.size() * 2);
  for (char c : text) {
    if (c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}
