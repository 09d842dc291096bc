/*
Candlewick: QuickPlot
Role: One-call chart helpers: build a Plot, save it to the configured image file and open it in the OS viewer.
Inputs/Outputs: Raw series or per-period samples plus a ChartConfig; writes config.outputFile.
Threading: Call from the thread owning the QGuiApplication.
Observability: Logs saved files and viewer failures to the app category.
Related: QuickPlot.cpp, plot/Plot.hpp, render/plotters/CandleChart.hpp, ChartConfig.hpp.
*/
#pragma once
#include <QStringList>
#include <vector>
#include "BarUnit.hpp"
#include "ChartConfig.hpp"
#include "plot/Plot.hpp"

class IChartTheme;

namespace QuickPlot {

// Theme named by config.themeId, or the classic theme when it is unknown
const IChartTheme& resolveTheme(const ChartConfig& config);

// Plot builders (no file output)
Plot linePlot(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config);
Plot scatterPlot(const std::vector<double>& x, const std::vector<double>& y, qreal radius, const ChartConfig& config);
Plot lineScatterPlot(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config);

/**
 * Candle chart with title, "Time [n unit]" / "Price [currency]" axis labels,
 * integer price ticks, nominal period labels on X and the X range set to
 * [config.xMin, periods * config.xMaxFactor].
 * Throws candlewick::EmptyInputError for empty input.
 */
Plot candlePlot(const QStringList& labels, const std::vector<std::vector<double>>& periods,
                const BarUnit& barUnit, const ChartConfig& config);

// Save to config.outputFile and open it when config.openViewer is set
bool saveAndOpen(const Plot& plot, const ChartConfig& config);

// Series helpers; x defaults to the sample index
bool singlePlot(const std::vector<double>& y, const ChartConfig& config);
bool plot(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config);
bool singleScatter(const std::vector<double>& y, const ChartConfig& config);
bool scatter(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config);
bool plotWithScatter(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config);
bool candleChart(const QStringList& labels, const std::vector<std::vector<double>>& periods,
                 const BarUnit& barUnit, const ChartConfig& config);

} // namespace QuickPlot
