#ifndef FF_LEDGER_LOGGER_H
#define FF_LEDGER_LOGGER_H

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace ff {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

/**
 * Parse a level name (case-insensitive: debug, info, warning, error, critical).
 * @return true if the name was recognized
 */
bool parseLevel(const std::string &name, Level &level);

/** One log call, built once and shared by every handler it reaches */
struct Record {
  Level level{ Level::INFO };
  std::string logger; // full dotted name, empty for the root
  std::string message;
  std::chrono::system_clock::time_point time;
};

// "[WARNING] [ledger.engine] message", prefixed by a UTC timestamp when asked
std::string formatRecord(const Record &record, bool withTime);

class Handler {
public:
  virtual ~Handler() = default;

  void handle(const Record &record) {
    if (record.level >= level_) {
      emit(record);
    }
  }

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  virtual void emit(const Record &record) = 0;

  Level level_ = Level::DEBUG;
};

// Writes to std::clog so command output on stdout stays clean
class ConsoleHandler : public Handler {
protected:
  void emit(const Record &record) override;
};

/** Appends timestamped lines; throws std::runtime_error if the file cannot be opened */
class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);

protected:
  void emit(const Record &record) override;

private:
  std::ofstream file_;
};

class Logger;
class LogStream;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level) : logger_(logger), level_(level) {}

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

/**
 * Collects one record and hands it to the logger on destruction.
 */
class LogStream {
public:
  LogStream(Logger *logger, Level level) : logger_(logger), level_(level) {}
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
};

/**
 * Tree node behind a named logger. Records propagate from a node to its
 * parent unless propagation is disabled.
 */
class LoggerNode {
public:
  LoggerNode(const std::string &name, std::shared_ptr<LoggerNode> parent);

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

  void addHandler(std::shared_ptr<Handler> spHandler);
  void clearHandlers();

  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  const std::string &getName() const { return name_; }
  const std::string &getFullName() const { return fullName_; }

  void log(Level level, const std::string &message);

private:
  void dispatch(const Record &record);

  std::string name_;
  std::string fullName_;
  std::shared_ptr<LoggerNode> spParent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  std::mutex mutex_;
};

/**
 * Lightweight handle on a LoggerNode with stream-style level proxies:
 *   log.info << "balance " << amount;
 */
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) { spNode_->addHandler(spHandler); }
  void clearHandlers() { spNode_->clearHandlers(); }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG);

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }

  const std::string &getName() const { return spNode_->getName(); }
  const std::string &getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;

  void log(Level level, const std::string &message) { spNode_->log(level, message); }

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

/**
 * Get (creating on first use) the logger with a dotted hierarchical name.
 * Missing ancestors are created; top-level loggers hang off the root, which
 * starts at INFO with a console handler.
 */
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace ff

#endif // FF_LEDGER_LOGGER_H
