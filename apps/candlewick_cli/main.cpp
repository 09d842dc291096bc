/*
Candlewick: main.cpp
Role: Command-line entry point: reads a candle chart input document and writes the chart image.
Usage: candlewick <input.json> [--config path] [--out file] [--no-viewer]
*/
#include <QGuiApplication>
#include <QStringList>
#include <exception>
#include <iostream>
#include <nlohmann/json.hpp>
#include "CandlewickLogging.hpp"
#include "ChartConfig.hpp"
#include "ChartInput.hpp"
#include "Errors.hpp"
#include "QuickPlot.hpp"

namespace {

struct CliOptions {
    QString inputPath;
    QString configPath = ChartConfig::defaultPath();
    QString outputFile;
    bool noViewer = false;
};

void printUsage() {
    std::cerr << "usage: candlewick <input.json> [--config path] [--out file] [--no-viewer]\n";
}

bool parseArgs(const QStringList& args, CliOptions& opts) {
    for (int i = 1; i < args.size(); ++i) {
        const QString& arg = args[i];
        if (arg == "--config" && i + 1 < args.size()) {
            opts.configPath = args[++i];
        } else if (arg == "--out" && i + 1 < args.size()) {
            opts.outputFile = args[++i];
        } else if (arg == "--no-viewer") {
            opts.noViewer = true;
        } else if (arg.startsWith("--") || !opts.inputPath.isEmpty()) {
            return false;
        } else {
            opts.inputPath = arg;
        }
    }
    return !opts.inputPath.isEmpty();
}

} // namespace

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    CliOptions opts;
    if (!parseArgs(app.arguments(), opts)) {
        printUsage();
        return 2;
    }

    ChartConfig config = ChartConfig::load(opts.configPath);
    if (!opts.outputFile.isEmpty()) config.outputFile = opts.outputFile;
    if (opts.noViewer) config.openViewer = false;

    try {
        ChartInput input = ChartInput::fromFile(opts.inputPath.toStdString());

        QStringList labels;
        for (const auto& label : input.labels) {
            labels << QString::fromStdString(label);
        }

        cwLog_App("Rendering" << input.periods.size() << "periods from" << opts.inputPath);
        if (!QuickPlot::candleChart(labels, input.periods, input.barUnit, config)) {
            return 1;
        }
    } catch (const candlewick::EmptyInputError& e) {
        cwLog_Error("Empty input:" << e.what());
        return 1;
    } catch (const candlewick::ChartInputError& e) {
        cwLog_Error("Invalid chart input:" << e.what());
        return 1;
    } catch (const nlohmann::json::exception& e) {
        cwLog_Error("Malformed JSON in" << opts.inputPath << ":" << e.what());
        return 1;
    }

    return 0;
}
