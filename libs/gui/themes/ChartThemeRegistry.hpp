#pragma once

#include "IChartTheme.hpp"
#include <QString>
#include <QStringList>
#include <memory>
#include <map>

/**
 * Registry of chart style presets.
 * The built-in themes are present from first use; further themes are
 * registered at startup and looked up by id. Plotters receive the chosen
 * styles explicitly.
 */
class ChartThemeRegistry {
public:
    /**
     * Get the singleton instance.
     */
    static ChartThemeRegistry& instance();
    
    /**
     * Register a theme with the registry.
     */
    void registerTheme(std::unique_ptr<IChartTheme> theme);
    
    /**
     * Look up a theme by ID; nullptr if unknown.
     */
    const IChartTheme* theme(const QString& themeId) const;
    
    /**
     * Get list of available theme IDs.
     */
    QStringList availableThemes() const;
    
    /**
     * Get theme name by ID.
     */
    QString themeName(const QString& themeId) const;
    
    /**
     * Register the built-in themes (classic, dark), replacing any theme
     * registered under those ids.
     */
    void initializeDefaults();

private:
    ChartThemeRegistry();
    ~ChartThemeRegistry() = default;
    ChartThemeRegistry(const ChartThemeRegistry&) = delete;
    ChartThemeRegistry& operator=(const ChartThemeRegistry&) = delete;
    
    std::map<QString, std::unique_ptr<IChartTheme>> m_themes;
};
