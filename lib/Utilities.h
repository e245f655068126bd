#ifndef FF_LEDGER_UTILITIES_H
#define FF_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ff {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 */
int64_t getCurrentTime();

/**
 * Format a unix timestamp as an ISO date (YYYY-MM-DD, UTC)
 */
std::string formatDate(int64_t unixSeconds);

/**
 * Parse an ISO date (YYYY-MM-DD) as UTC midnight
 * @return Seconds since the epoch, or error if the date is malformed
 */
Roe<int64_t> parseDate(const std::string &str);

bool parseInt(const std::string &str, int &value);
bool parseInt64(const std::string &str, int64_t &value);
bool parseUInt64(const std::string &str, uint64_t &value);

/** Strip leading and trailing ASCII whitespace */
std::string trim(const std::string &str);

/** ASCII lower-casing, used as the case-insensitive name key */
std::string toLower(const std::string &str);

/**
 * Split on a single character delimiter; empty fields are kept
 */
std::vector<std::string> split(const std::string &str, char delimiter);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed document, or error if missing or malformed
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

} // namespace utl
} // namespace ff

#endif // FF_LEDGER_UTILITIES_H
