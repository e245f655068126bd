#include "Utilities.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace ff {
namespace utl {

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string formatDate(int64_t unixSeconds) {
  time_t t = static_cast<time_t>(unixSeconds);
  std::tm utc{};
  if (!gmtime_r(&t, &utc)) {
    return std::to_string(unixSeconds);
  }
  char buf[16];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d", &utc) == 0) {
    return std::to_string(unixSeconds);
  }
  return std::string(buf);
}

// Days since 1970-01-01 for a proleptic Gregorian date
static int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

Roe<int64_t> parseDate(const std::string &str) {
  auto parts = split(str, '-');
  if (parts.size() != 3 || parts[0].size() != 4 || parts[1].size() != 2 ||
      parts[2].size() != 2) {
    return Error(1, "Invalid date (expected YYYY-MM-DD): " + str);
  }
  int year = 0, month = 0, day = 0;
  if (!parseInt(parts[0], year) || !parseInt(parts[1], month) ||
      !parseInt(parts[2], day)) {
    return Error(1, "Invalid date (expected YYYY-MM-DD): " + str);
  }
  static const int daysInMonth[] = {31, 28, 31, 30, 31, 30,
                                    31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12 || day < 1) {
    return Error(2, "Date out of range: " + str);
  }
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  int maxDay = daysInMonth[month - 1] + ((month == 2 && leap) ? 1 : 0);
  if (day > maxDay) {
    return Error(2, "Date out of range: " + str);
  }
  return daysFromCivil(year, static_cast<unsigned>(month),
                       static_cast<unsigned>(day)) *
         86400;
}

bool parseInt(const std::string &str, int &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parseInt64(const std::string &str, int64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

std::string trim(const std::string &str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
    --end;
  }
  return str.substr(begin, end - begin);
}

std::string toLower(const std::string &str) {
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::vector<std::string> split(const std::string &str, char delimiter) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(delimiter, start);
    if (pos == std::string::npos) {
      out.push_back(str.substr(start));
      break;
    }
    out.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "Configuration file not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open configuration file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  file.close();

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return doc;
}

} // namespace utl
} // namespace ff
