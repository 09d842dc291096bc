#pragma once
#include <QString>

/**
 * ChartConfig - output and presentation settings read from an INI file.
 *
 * Missing keys keep their defaults; loading never fails. The file path is
 * taken from CANDLEWICK_CONFIG when set, otherwise "config.ini".
 */
struct ChartConfig {
    QString outputFile = "img.png";
    double widthInches = 10.0;
    double heightInches = 6.0;
    int dpi = 96;
    bool openViewer = true;

    QString title = "Candle Chart";
    QString currencyUnit = "yen";
    QString themeId = "classic";
    double xMin = -0.5;
    double xMaxFactor = 1.1;

    // Largest image edge accepted, in pixels
    static constexpr int kMaxImagePx = 32767;

    // Pixel size for the image; 0 when the size is not finite and positive,
    // capped at kMaxImagePx
    int widthPx() const { return toPixels(widthInches); }
    int heightPx() const { return toPixels(heightInches); }

    static QString defaultPath();
    static ChartConfig load(const QString& path = defaultPath());

private:
    int toPixels(double inches) const;
};
