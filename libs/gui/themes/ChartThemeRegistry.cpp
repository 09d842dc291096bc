#include "ChartThemeRegistry.hpp"
#include "ClassicTheme.hpp"
#include "DarkTheme.hpp"
#include "CandlewickLogging.hpp"

ChartThemeRegistry::ChartThemeRegistry() {
    initializeDefaults();
}

ChartThemeRegistry& ChartThemeRegistry::instance() {
    static ChartThemeRegistry instance;
    return instance;
}

void ChartThemeRegistry::registerTheme(std::unique_ptr<IChartTheme> theme) {
    if (!theme) {
        cwLog_Warning("ChartThemeRegistry: Attempted to register null theme");
        return;
    }
    
    QString id = theme->id();
    if (m_themes.find(id) != m_themes.end()) {
        cwLog_Warning("ChartThemeRegistry: Theme" << id << "already registered, replacing");
    }
    
    m_themes[id] = std::move(theme);
    cwLog_App("ChartThemeRegistry: Registered theme" << id << "-" << m_themes[id]->name());
}

const IChartTheme* ChartThemeRegistry::theme(const QString& themeId) const {
    auto it = m_themes.find(themeId);
    return it == m_themes.end() ? nullptr : it->second.get();
}

QStringList ChartThemeRegistry::availableThemes() const {
    QStringList themes;
    for (const auto& pair : m_themes) {
        themes << pair.first;
    }
    return themes;
}

QString ChartThemeRegistry::themeName(const QString& themeId) const {
    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        return QString();
    }
    return it->second->name();
}

void ChartThemeRegistry::initializeDefaults() {
    registerTheme(std::make_unique<ClassicTheme>());
    registerTheme(std::make_unique<DarkTheme>());
}
