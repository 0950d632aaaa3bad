#include "fitscore/config/config_holder.h"

#include <stdexcept>
#include <utility>

namespace fitscore::config {

ConfigHolder::ConfigHolder(std::shared_ptr<const EngineConfig> initial)
    : current_(std::move(initial)) {
  if (!current_) {
    throw std::invalid_argument("ConfigHolder requires an initial configuration");
  }
}

std::shared_ptr<const EngineConfig> ConfigHolder::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

core::Result<bool, std::string> ConfigHolder::swap(std::shared_ptr<const EngineConfig> next) {
  if (!next) {
    return core::Result<bool, std::string>::err("cannot install a null configuration");
  }
  auto valid = validate_engine_config(*next);
  if (!valid.has_value()) {
    return valid;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  current_ = std::move(next);
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace fitscore::config
