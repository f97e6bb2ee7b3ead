#ifndef LOGRETRY_LOG_H
#define LOGRETRY_LOG_H

#include <memory>
#include <spdlog/logger.h>

namespace logretry {

inline constexpr auto loggerName = "logretry";

// Logger used for the library's own diagnostics. Registered on first use with
// a stderr sink unless the application already registered one named "logretry".
// It must not feed back into a drain it reports on.
std::shared_ptr<spdlog::logger> log();

} // namespace logretry

#endif // LOGRETRY_LOG_H
