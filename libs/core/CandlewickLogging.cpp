#include "CandlewickLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "candlewick.app")         // Application: startup, config, output files, viewer
Q_LOGGING_CATEGORY(logData, "candlewick.data")       // Data: input parsing, candle aggregation, series build
Q_LOGGING_CATEGORY(logRender, "candlewick.render")   // Render: plotters, canvas, axes, ticks
Q_LOGGING_CATEGORY(logDebug, "candlewick.debug", QtWarningMsg)  // Debug: disabled by default
