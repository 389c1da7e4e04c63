#pragma once

#include <respkit/logger.hpp>

namespace respkit {

/// Library-wide configuration.
///
/// The value model itself has no tunables; everything here is about
/// diagnostics. Apply once at startup, before any logging happens.
struct config {
  /// Minimum level that reaches the sink. `off` disables logging.
  log_level level = log_level::off;

  /// Custom sink. nullptr selects the default stderr sink.
  log_function sink = nullptr;

  /// Opaque pointer handed back to `sink`.
  void* sink_user_data = nullptr;
};

inline void configure(config const& cfg) {
  auto& log = get_logger();
  log.set_log_function(cfg.sink, cfg.sink_user_data);
  log.set_log_level(cfg.level);
}

}  // namespace respkit
