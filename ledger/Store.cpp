#include "Store.h"

namespace ff {

Store::UnitOfWork::~UnitOfWork() {
  if (active_) {
    store_.rollbackUnit();
  }
}

Store::Roe<void> Store::UnitOfWork::begin() {
  if (active_) {
    return Error(E_STATE, "Unit of work already started");
  }
  auto result = store_.beginUnit();
  if (!result) {
    return result;
  }
  active_ = true;
  return {};
}

Store::Roe<void> Store::UnitOfWork::commit() {
  if (!active_) {
    return Error(E_STATE, "Unit of work not started");
  }
  auto result = store_.commitUnit();
  if (!result) {
    return result;
  }
  active_ = false;
  return {};
}

} // namespace ff
