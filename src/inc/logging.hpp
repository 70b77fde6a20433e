#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace evo::log {

inline constexpr char const* logger_name = "evo20";

namespace details {

  struct logger_slot {
    std::mutex lock;
    std::shared_ptr<spdlog::logger> current;
  };

  inline logger_slot& slot() {
    static logger_slot instance{};
    return instance;
  }

} // namespace details

// logger used by the library, created on first use with a colour stdout sink
// unless one named "evo20" is already registered with spdlog
inline std::shared_ptr<spdlog::logger> logger() {
  auto& slot = details::slot();
  std::scoped_lock guard{slot.lock};

  if (!slot.current) {
    slot.current = spdlog::get(logger_name);
    if (!slot.current) {
      slot.current = spdlog::stdout_color_mt(logger_name);
    }
  }

  return slot.current;
}

// replaces the library logger, passing nullptr restores the default one
inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
  auto& slot = details::slot();
  std::scoped_lock guard{slot.lock};

  slot.current = std::move(replacement);
}

} // namespace evo::log
