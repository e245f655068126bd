#pragma once

#include "Logger.h"
#include <string>

namespace ff {

/**
 * Base for ledger components that log under their own dotted name
 * (e.g. "ledger.engine"). Components are bound to one store and are not
 * copyable.
 */
class Module {
public:
  explicit Module(const std::string &name) : logger_(logging::getLogger(name)) {}
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  logging::Logger &log() const { return logger_; }

private:
  mutable logging::Logger logger_;
};

} // namespace ff
