#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>

namespace ff {
namespace logging {

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

bool parseLevel(const std::string &name, Level &level) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  static const std::map<std::string, Level> names = {
      {"debug", Level::DEBUG},     {"info", Level::INFO},
      {"warning", Level::WARNING}, {"warn", Level::WARNING},
      {"error", Level::ERROR},     {"critical", Level::CRITICAL},
  };
  auto it = names.find(lower);
  if (it == names.end()) {
    return false;
  }
  level = it->second;
  return true;
}

std::string formatRecord(const Record &record, bool withTime) {
  std::ostringstream ss;
  if (withTime) {
    auto seconds = std::chrono::system_clock::to_time_t(record.time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  record.time.time_since_epoch()) %
              1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count() << "Z ";
  }
  ss << '[' << levelToString(record.level) << "] ";
  if (!record.logger.empty()) {
    ss << '[' << record.logger << "] ";
  }
  ss << record.message;
  return ss.str();
}

void ConsoleHandler::emit(const Record &record) {
  std::clog << formatRecord(record, false) << std::endl;
}

FileHandler::FileHandler(const std::string &filename) {
  file_.open(filename, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename);
  }
}

void FileHandler::emit(const Record &record) {
  file_ << formatRecord(record, true) << '\n';
  file_.flush();
}

LogStream::~LogStream() {
  if (logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_), stream_(std::move(other.stream_)) {
  other.logger_ = nullptr;
}

LoggerNode::LoggerNode(const std::string &name, std::shared_ptr<LoggerNode> parent)
    : name_(name), spParent_(std::move(parent)) {
  if (spParent_ && !spParent_->getFullName().empty()) {
    fullName_ = spParent_->getFullName() + "." + name_;
  } else {
    fullName_ = name_;
  }
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }

  Record record;
  record.level = level;
  record.logger = fullName_;
  record.message = message;
  record.time = std::chrono::system_clock::now();

  // Each node on the way up filters by its own level
  LoggerNode *node = this;
  while (node) {
    if (level >= node->getLevel()) {
      node->dispatch(record);
    }
    if (!node->getPropagate()) {
      break;
    }
    node = node->spParent_.get();
  }
}

void LoggerNode::dispatch(const Record &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &spHandler : spHandlers_) {
    spHandler->handle(record);
  }
}

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(std::move(node)) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

// Proxies point at their owning Logger, so a copy rebinds them
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

namespace {

std::mutex &registryMutex() {
  static std::mutex mutex;
  return mutex;
}

// Caller holds registryMutex()
std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &name) {
  static std::map<std::string, std::shared_ptr<LoggerNode>> registry;
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  std::shared_ptr<LoggerNode> node;
  if (name.empty()) {
    node = std::make_shared<LoggerNode>("", nullptr);
    node->addHandler(std::make_shared<ConsoleHandler>());
    node->setLevel(Level::INFO);
  } else {
    auto lastDot = name.rfind('.');
    std::string parentPath = lastDot == std::string::npos ? "" : name.substr(0, lastDot);
    std::string leaf = lastDot == std::string::npos ? name : name.substr(lastDot + 1);
    node = std::make_shared<LoggerNode>(leaf, getOrCreateNode(parentPath));
  }
  registry[name] = node;
  return node;
}

} // namespace

Logger getLogger(const std::string &name) {
  std::string key = name;
  while (!key.empty() && key.front() == '.') {
    key.erase(0, 1);
  }
  std::lock_guard<std::mutex> lock(registryMutex());
  return Logger(getOrCreateNode(key));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace ff
