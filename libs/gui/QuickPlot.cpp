#include "QuickPlot.hpp"
#include "CandleSeries.hpp"
#include "CandlewickLogging.hpp"
#include "models/IntegerTicks.hpp"
#include "render/plotters/CandleChart.hpp"
#include "render/plotters/XYPlotters.hpp"
#include "themes/ChartThemeRegistry.hpp"
#include "themes/ClassicTheme.hpp"
#include <QDesktopServices>
#include <QFileInfo>
#include <QUrl>
#include <memory>
#include <utility>

namespace QuickPlot {

namespace {

// Scatter radii used by the one-call helpers
constexpr qreal kSingleScatterRadius = 1.0;
constexpr qreal kScatterRadius = 2.0;

Plot themedPlot(const ChartConfig& config) {
    Plot p;
    p.applyTheme(resolveTheme(config));
    return p;
}

} // namespace

const IChartTheme& resolveTheme(const ChartConfig& config) {
    static const ClassicTheme fallback;

    if (const IChartTheme* theme = ChartThemeRegistry::instance().theme(config.themeId)) {
        return *theme;
    }
    cwLog_Warning("QuickPlot: unknown theme" << config.themeId << "- using classic");
    return fallback;
}

Plot linePlot(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config) {
    Plot p = themedPlot(config);
    p.add(std::make_shared<LinePlotter>(pairedXYs(x, y), resolveTheme(config).lineStyle()));
    return p;
}

Plot scatterPlot(const std::vector<double>& x, const std::vector<double>& y, qreal radius, const ChartConfig& config) {
    Plot p = themedPlot(config);
    auto scatter = std::make_shared<ScatterPlotter>(pairedXYs(x, y), resolveTheme(config).glyphStyle());
    scatter->setRadius(radius);
    p.add(scatter);
    return p;
}

Plot lineScatterPlot(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config) {
    const IChartTheme& theme = resolveTheme(config);
    XYs points = pairedXYs(x, y);

    Plot p = themedPlot(config);
    auto scatter = std::make_shared<ScatterPlotter>(points, theme.glyphStyle());
    scatter->setRadius(kScatterRadius);
    p.add(scatter);
    p.add(std::make_shared<LinePlotter>(std::move(points), theme.lineStyle()));
    return p;
}

Plot candlePlot(const QStringList& labels, const std::vector<std::vector<double>>& periods,
                const BarUnit& barUnit, const ChartConfig& config) {
    auto chart = std::make_shared<CandleChart>(CandleSeries::build(periods),
                                               resolveTheme(config).candleStyle());

    Plot p = themedPlot(config);
    p.add(chart);

    p.setTitle(config.title);
    p.xAxis().label = QString::fromStdString(barUnit.axisLabel());
    p.yAxis().label = QString("Price [%1]").arg(config.currencyUnit);
    p.yAxis().tickMarker = std::make_shared<IntegerTicks>();
    p.nominalX(labels);

    p.xAxis().min = config.xMin;
    p.xAxis().max = static_cast<double>(periods.size()) * config.xMaxFactor;
    return p;
}

bool saveAndOpen(const Plot& plot, const ChartConfig& config) {
    if (!plot.save(config.widthPx(), config.heightPx(), config.outputFile)) {
        return false;
    }

    if (config.openViewer) {
        const QString absolute = QFileInfo(config.outputFile).absoluteFilePath();
        if (!QDesktopServices::openUrl(QUrl::fromLocalFile(absolute))) {
            cwLog_Warning("QuickPlot: could not open" << absolute << "in the system viewer");
        }
    }
    return true;
}

bool singlePlot(const std::vector<double>& y, const ChartConfig& config) {
    XYs points = indexedXYs(y);
    Plot p = themedPlot(config);
    p.add(std::make_shared<LinePlotter>(std::move(points), resolveTheme(config).lineStyle()));
    return saveAndOpen(p, config);
}

bool plot(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config) {
    return saveAndOpen(linePlot(x, y, config), config);
}

bool singleScatter(const std::vector<double>& y, const ChartConfig& config) {
    Plot p = themedPlot(config);
    auto scatter = std::make_shared<ScatterPlotter>(indexedXYs(y), resolveTheme(config).glyphStyle());
    scatter->setRadius(kSingleScatterRadius);
    p.add(scatter);
    return saveAndOpen(p, config);
}

bool scatter(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config) {
    return saveAndOpen(scatterPlot(x, y, kScatterRadius, config), config);
}

bool plotWithScatter(const std::vector<double>& x, const std::vector<double>& y, const ChartConfig& config) {
    return saveAndOpen(lineScatterPlot(x, y, config), config);
}

bool candleChart(const QStringList& labels, const std::vector<std::vector<double>>& periods,
                 const BarUnit& barUnit, const ChartConfig& config) {
    return saveAndOpen(candlePlot(labels, periods, barUnit, config), config);
}

} // namespace QuickPlot
