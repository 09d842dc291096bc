#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// CANDLEWICK LOGGING CATEGORIES
// =============================================================================
// Four categories, each with atomic throttling for high-frequency call sites

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: startup, config, output files, viewer
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: input parsing, candle aggregation, series build
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: plotters, canvas, axes, ticks
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

namespace candlewick::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Log every app event
    inline constexpr int kData   = 20;   // Log every 20th data operation
    inline constexpr int kRender = 100;  // Log every 100th render operation
    inline constexpr int kDebug  = 10;   // Log every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define CWLOG_THROTTLED(cat, defaultInterval, ...)                                  \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("CANDLEWICK_LOG_" #cat "_INTERVAL");      \
            int parsed = env ? std::atoi(env) : (defaultInterval);                  \
            return parsed > 0 ? parsed : 1;                                          \
        }();                                                                         \
        if ((_counter++ % static_cast<uint32_t>(_interval)) == 0) {                  \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

// Primary logging macros (throttled for hot paths)
#define cwLog_App(...)     CWLOG_THROTTLED(App, candlewick::log_throttle::kApp, __VA_ARGS__)
#define cwLog_Data(...)    CWLOG_THROTTLED(Data, candlewick::log_throttle::kData, __VA_ARGS__)
#define cwLog_Render(...)  CWLOG_THROTTLED(Render, candlewick::log_throttle::kRender, __VA_ARGS__)
#define cwLog_Debug(...)   CWLOG_THROTTLED(Debug, candlewick::log_throttle::kDebug, __VA_ARGS__)

// Always-on macros (no throttling)
#define cwLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define cwLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export CANDLEWICK_LOG_Render_INTERVAL=1      # log every render message
//   export QT_LOGGING_RULES="candlewick.*.debug=true"
