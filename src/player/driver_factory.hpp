#pragma once

#include "../core/config/settings.hpp"
#include "coarse_driver.hpp"
#include "mpv_ipc_driver.hpp"
#include "player_driver.hpp"
#include <functional>
#include <memory>

namespace cue {

using DriverFactory = std::function<std::unique_ptr<PlayerDriver>(const Settings &)>;

inline std::unique_ptr<PlayerDriver> make_driver(const Settings &settings) {
  if (settings.driver_mode == DriverMode::Precise) {
    return std::make_unique<MpvIpcDriver>(settings);
  }
  return std::make_unique<CoarseDriver>(settings);
}

} // namespace cue
