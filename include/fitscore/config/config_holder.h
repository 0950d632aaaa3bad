#pragma once

#include "fitscore/config/engine_config.h"

#include <memory>
#include <mutex>

namespace fitscore::config {

// ConfigHolder publishes the active configuration for hot reload.
//
// Thread-safety: the pointer is swapped under a mutex. Readers take a snapshot via current()
// and keep evaluating against it; a later swap never touches tables already handed out.
class ConfigHolder final {
 public:
  explicit ConfigHolder(std::shared_ptr<const EngineConfig> initial);
  ~ConfigHolder() = default;

  // Disable copy/move (mutex not copyable)
  ConfigHolder(const ConfigHolder&) = delete;
  ConfigHolder& operator=(const ConfigHolder&) = delete;
  ConfigHolder(ConfigHolder&&) = delete;
  ConfigHolder& operator=(ConfigHolder&&) = delete;

  [[nodiscard]] std::shared_ptr<const EngineConfig> current() const;

  // swap validates `next` and installs it. On failure the active config is unchanged.
  [[nodiscard]] core::Result<bool, std::string> swap(std::shared_ptr<const EngineConfig> next);

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const EngineConfig> current_;
};

}  // namespace fitscore::config
