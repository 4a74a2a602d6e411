#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <filesystem>
#include <string>

/**
 * @brief Content fingerprint used for duplicate and version detection
 *
 * Two files are treated as byte-identical when their fingerprints compare
 * equal, so implementations must be collision resistant.
 */
class IHashCalculator {
public:
    /**
     * @brief Hashes the full content of a file
     * @return Lowercase hex digest, never empty
     * @throws HashError if the content cannot be read
     */
    virtual std::string calculateHash(const std::filesystem::path& filePath) const = 0;
    virtual ~IHashCalculator() = default;
};

#endif // IHASHCALCULATOR_HPP
