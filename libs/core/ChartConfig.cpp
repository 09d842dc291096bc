#include "ChartConfig.hpp"
#include "CandlewickLogging.hpp"
#include <QFile>
#include <QSettings>
#include <cmath>

namespace {

bool validSize(double inches, double maxInches) {
    return std::isfinite(inches) && inches > 0.0 && inches <= maxInches;
}

} // namespace

int ChartConfig::toPixels(double inches) const {
    const double px = inches * dpi;
    if (!std::isfinite(px) || px <= 0.0) return 0;
    if (px >= kMaxImagePx) return kMaxImagePx;
    return static_cast<int>(px);
}

QString ChartConfig::defaultPath() {
    const QString envPath = qEnvironmentVariable("CANDLEWICK_CONFIG");
    return envPath.isEmpty() ? QStringLiteral("config.ini") : envPath;
}

ChartConfig ChartConfig::load(const QString& path) {
    ChartConfig cfg;

    if (!QFile::exists(path)) {
        cwLog_App("ChartConfig:" << path << "not found, using defaults");
    } else {
        QSettings config(path, QSettings::IniFormat);
        cfg.outputFile   = config.value("output/file", cfg.outputFile).toString();
        cfg.widthInches  = config.value("output/widthInches", cfg.widthInches).toDouble();
        cfg.heightInches = config.value("output/heightInches", cfg.heightInches).toDouble();
        cfg.dpi          = config.value("output/dpi", cfg.dpi).toInt();
        cfg.openViewer   = config.value("output/openViewer", cfg.openViewer).toBool();
        cfg.title        = config.value("chart/title", cfg.title).toString();
        cfg.currencyUnit = config.value("chart/currencyUnit", cfg.currencyUnit).toString();
        cfg.themeId      = config.value("chart/theme", cfg.themeId).toString();
        cfg.xMin         = config.value("chart/xMin", cfg.xMin).toDouble();
        cfg.xMaxFactor   = config.value("chart/xMaxFactor", cfg.xMaxFactor).toDouble();

        if (cfg.dpi <= 0) {
            cwLog_Warning("ChartConfig: invalid dpi" << cfg.dpi << "- using 96");
            cfg.dpi = 96;
        }
        const double maxInches = static_cast<double>(kMaxImagePx) / cfg.dpi;
        if (!validSize(cfg.widthInches, maxInches)) {
            cwLog_Warning("ChartConfig: invalid output/widthInches" << cfg.widthInches << "- using 10");
            cfg.widthInches = 10.0;
        }
        if (!validSize(cfg.heightInches, maxInches)) {
            cwLog_Warning("ChartConfig: invalid output/heightInches" << cfg.heightInches << "- using 6");
            cfg.heightInches = 6.0;
        }
        cwLog_App("ChartConfig loaded from" << path);
    }

    if (qEnvironmentVariable("CANDLEWICK_NO_VIEWER") == QLatin1String("1")) {
        cfg.openViewer = false;
    }
    return cfg;
}
