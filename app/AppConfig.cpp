#include "AppConfig.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

namespace ff {

nlohmann::json AppConfig::ltsToJson() const {
  nlohmann::json j;
  j["database"] = database;
  j["owner"] = owner;
  j["logLevel"] = logLevel;
  j["logFile"] = logFile;
  j["busyTimeoutMs"] = busyTimeoutMs;
  return j;
}

AppConfig::Roe<void> AppConfig::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    if (jd.contains("database")) {
      if (!jd["database"].is_string()) {
        return Error(E_CONFIG, "Field 'database' must be a string");
      }
      database = jd["database"].get<std::string>();
      if (database.empty()) {
        return Error(E_CONFIG, "Field 'database' cannot be empty");
      }
    }

    if (jd.contains("owner")) {
      if (!jd["owner"].is_string()) {
        return Error(E_CONFIG, "Field 'owner' must be a string");
      }
      owner = jd["owner"].get<std::string>();
    }

    if (jd.contains("logLevel")) {
      if (!jd["logLevel"].is_string()) {
        return Error(E_CONFIG, "Field 'logLevel' must be a string");
      }
      logLevel = jd["logLevel"].get<std::string>();
      logging::Level level;
      if (!logging::parseLevel(logLevel, level)) {
        return Error(E_CONFIG, "Field 'logLevel' has unknown level: " + logLevel);
      }
    }

    if (jd.contains("logFile")) {
      if (!jd["logFile"].is_string()) {
        return Error(E_CONFIG, "Field 'logFile' must be a string");
      }
      logFile = jd["logFile"].get<std::string>();
    }

    if (jd.contains("busyTimeoutMs")) {
      if (!jd["busyTimeoutMs"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'busyTimeoutMs' must be a positive number");
      }
      busyTimeoutMs = jd["busyTimeoutMs"].get<int>();
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG, "Failed to parse configuration: " + std::string(e.what()));
  }
}

AppConfig::Roe<AppConfig> AppConfig::loadFile(const std::string &path) {
  auto json = utl::loadJsonFile(path);
  if (!json) {
    return Error(E_CONFIG, json.error().message);
  }
  AppConfig config;
  auto parsed = config.ltsFromJson(json.value());
  if (!parsed) {
    return Error(E_CONFIG, "Invalid configuration in " + path + ": " + parsed.error().message);
  }
  return config;
}

} // namespace ff
