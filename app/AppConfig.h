#ifndef FF_LEDGER_APP_CONFIG_H
#define FF_LEDGER_APP_CONFIG_H

#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace ff {

/**
 * Settings of the command line front end, read from a JSON file.
 * Command line flags override what the file sets.
 */
struct AppConfig {
  constexpr static int32_t E_CONFIG = 1;

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  std::string database{ "ledger.db" };
  std::string owner;
  std::string logLevel{ "warning" };
  std::string logFile;
  int busyTimeoutMs{ 5000 };

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);

  static Roe<AppConfig> loadFile(const std::string &path);
};

} // namespace ff

#endif // FF_LEDGER_APP_CONFIG_H
