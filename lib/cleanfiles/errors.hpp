/**
 * @file errors.hpp
 * @brief Exception types raised by the cleanfiles library
 *
 * All errors derive from CleanError so front-ends can catch the whole family
 * in one place. Only ConfigError is fatal; the other kinds are caught inside
 * the stage that raised them and reported as warnings or failed actions.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

class CleanError : public std::runtime_error {
public:
  explicit CleanError(const std::string &message)
      : std::runtime_error(message) {}
};

/** @brief Directory or file could not be listed or stat'ed during a scan */
class ScanError : public CleanError {
public:
  using CleanError::CleanError;
};

/** @brief File content could not be read while fingerprinting */
class HashError : public CleanError {
public:
  using CleanError::CleanError;
};

/** @brief Delete, rename, chmod or move failed during execution */
class ActionError : public CleanError {
public:
  using CleanError::CleanError;
};

/** @brief Settings are malformed; raised before the core runs */
class ConfigError : public CleanError {
public:
  using CleanError::CleanError;
};

#endif // ERRORS_HPP
