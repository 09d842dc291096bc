#include "Plot.hpp"
#include "../canvas/PainterCanvas.hpp"
#include "../models/DefaultTicks.hpp"
#include "../themes/IChartTheme.hpp"
#include "CandlewickLogging.hpp"
#include <QFont>
#include <QFontMetricsF>
#include <QImage>
#include <QPainter>
#include <algorithm>
#include <cmath>

namespace {
constexpr qreal kPadding = 6.0;
constexpr qreal kMinorTickRatio = 0.5;
}

void Axis::extend(double lo, double hi) {
    if (std::isfinite(lo)) min = std::min(min, lo);
    if (std::isfinite(hi)) max = std::max(max, hi);
}

std::pair<double, double> Axis::displayRange() const {
    double lo = min;
    double hi = max;
    if (!std::isfinite(lo) && !std::isfinite(hi)) return {0.0, 1.0};
    if (!std::isfinite(lo)) lo = hi - 1.0;
    if (!std::isfinite(hi)) hi = lo + 1.0;
    if (hi < lo) std::swap(lo, hi);
    if (hi == lo) return {lo - 1.0, hi + 1.0};
    return {lo, hi};
}

Plot::Plot() {
    m_x.tickMarker = std::make_shared<DefaultTicks>();
    m_y.tickMarker = std::make_shared<DefaultTicks>();
}

void Plot::applyTheme(const IChartTheme& theme) {
    m_background = theme.background();
    m_foreground = theme.foreground();
}

void Plot::add(std::shared_ptr<IPlotter> plotter) {
    if (!plotter) {
        cwLog_Warning("Plot: Attempted to add null plotter");
        return;
    }

    if (auto* ranger = dynamic_cast<const IDataRanger*>(plotter.get())) {
        DataRange range = ranger->dataRange();
        m_x.extend(range.xMin, range.xMax);
        m_y.extend(range.yMin, range.yMax);
    }
    m_plotters.push_back(std::move(plotter));
}

void Plot::nominalX(const QStringList& labels) {
    std::vector<Tick> ticks;
    ticks.reserve(labels.size());
    for (int i = 0; i < labels.size(); ++i) {
        ticks.push_back({static_cast<double>(i), labels[i]});
    }
    m_x.tickMarker = std::make_shared<ConstantTicks>(std::move(ticks));
    m_x.tickLength = 0.0;
    m_x.showLine = false;
}

Viewport Plot::viewport(const Canvas& canvas) const {
    auto [xMin, xMax] = m_x.displayRange();
    auto [yMin, yMax] = m_y.displayRange();
    return Viewport{xMin, xMax, yMin, yMax, canvas.area()};
}

PlotTransform Plot::transforms(const Canvas& canvas) const {
    return CoordinateSystem::transforms(viewport(canvas));
}

QRectF Plot::dataArea(QPainter& painter, const QRectF& area) const {
    QFontMetricsF fm(painter.font());

    auto [yMin, yMax] = m_y.displayRange();
    qreal tickLabelWidth = 0.0;
    for (const auto& tick : m_y.tickMarker->ticks(yMin, yMax)) {
        tickLabelWidth = std::max(tickLabelWidth, fm.horizontalAdvance(tick.label));
    }

    qreal top = kPadding + (m_title.isEmpty() ? 0.0 : fm.height() * 1.5 + kPadding);
    qreal left = kPadding + (m_y.label.isEmpty() ? 0.0 : fm.height() + kPadding)
               + tickLabelWidth + kPadding + m_y.tickLength;
    qreal bottom = kPadding + fm.height() + kPadding + m_x.tickLength
                 + (m_x.label.isEmpty() ? 0.0 : fm.height() + kPadding);
    qreal right = kPadding * 2;

    return area.adjusted(left, top, -right, -bottom);
}

void Plot::draw(QPainter& painter, const QRectF& area) const {
    painter.save();
    painter.fillRect(area, m_background);

    const QRectF data = dataArea(painter, area);
    if (data.width() <= 0.0 || data.height() <= 0.0) {
        cwLog_Warning("Plot: area" << area << "too small to draw into");
        painter.restore();
        return;
    }

    drawAxes(painter, data);

    PainterCanvas canvas(painter, data);
    for (const auto& plotter : m_plotters) {
        cwLog_Render("Plot: drawing" << plotter->getPlotterName());
        plotter->plot(canvas, *this);
    }

    QFontMetricsF fm(painter.font());
    painter.setPen(m_foreground);

    if (!m_title.isEmpty()) {
        QFont titleFont = painter.font();
        titleFont.setPointSizeF(titleFont.pointSizeF() * 1.3);
        painter.save();
        painter.setFont(titleFont);
        painter.drawText(QRectF(area.left(), area.top() + kPadding, area.width(), fm.height() * 1.5),
                         Qt::AlignHCenter | Qt::AlignVCenter, m_title);
        painter.restore();
    }

    if (!m_x.label.isEmpty()) {
        painter.drawText(QRectF(data.left(), area.bottom() - kPadding - fm.height(), data.width(), fm.height()),
                         Qt::AlignHCenter | Qt::AlignVCenter, m_x.label);
    }

    if (!m_y.label.isEmpty()) {
        painter.save();
        painter.translate(area.left() + kPadding, data.center().y());
        painter.rotate(-90);
        painter.drawText(QRectF(-data.height() / 2.0, 0.0, data.height(), fm.height()),
                         Qt::AlignHCenter | Qt::AlignVCenter, m_y.label);
        painter.restore();
    }

    painter.restore();
}

void Plot::drawAxes(QPainter& painter, const QRectF& data) const {
    QFontMetricsF fm(painter.font());
    const PlotTransform tr = CoordinateSystem::transforms(Viewport{
        m_x.displayRange().first, m_x.displayRange().second,
        m_y.displayRange().first, m_y.displayRange().second, data});

    painter.save();
    painter.setPen(QPen(m_foreground, 1.0));

    if (m_x.showLine) painter.drawLine(data.bottomLeft(), data.bottomRight());
    if (m_y.showLine) painter.drawLine(data.bottomLeft(), data.topLeft());

    auto [xMin, xMax] = m_x.displayRange();
    for (const auto& tick : m_x.tickMarker->ticks(xMin, xMax)) {
        if (tick.value < xMin || tick.value > xMax) continue;
        const qreal sx = tr.x(tick.value);
        const qreal len = tick.isMinor() ? m_x.tickLength * kMinorTickRatio : m_x.tickLength;
        if (len > 0.0) painter.drawLine(QPointF(sx, data.bottom()), QPointF(sx, data.bottom() + len));
        if (!tick.isMinor()) {
            const qreal w = fm.horizontalAdvance(tick.label);
            painter.drawText(QRectF(sx - w / 2.0, data.bottom() + m_x.tickLength + kPadding, w, fm.height()),
                             Qt::AlignCenter, tick.label);
        }
    }

    auto [yMin, yMax] = m_y.displayRange();
    for (const auto& tick : m_y.tickMarker->ticks(yMin, yMax)) {
        if (tick.value < yMin || tick.value > yMax) continue;
        const qreal sy = tr.y(tick.value);
        const qreal len = tick.isMinor() ? m_y.tickLength * kMinorTickRatio : m_y.tickLength;
        if (len > 0.0) painter.drawLine(QPointF(data.left() - len, sy), QPointF(data.left(), sy));
        if (!tick.isMinor()) {
            const qreal w = fm.horizontalAdvance(tick.label);
            painter.drawText(QRectF(data.left() - m_y.tickLength - kPadding - w, sy - fm.height() / 2.0, w, fm.height()),
                             Qt::AlignRight | Qt::AlignVCenter, tick.label);
        }
    }

    painter.restore();
}

bool Plot::save(int widthPx, int heightPx, const QString& path) const {
    if (widthPx <= 0 || heightPx <= 0) {
        cwLog_Error("Plot: invalid image size" << widthPx << "x" << heightPx);
        return false;
    }

    QImage image(widthPx, heightPx, QImage::Format_ARGB32_Premultiplied);
    image.fill(m_background);
    {
        QPainter painter(&image);
        draw(painter, QRectF(0, 0, widthPx, heightPx));
    }

    if (!image.save(path)) {
        cwLog_Error("Plot: failed to write" << path);
        return false;
    }
    cwLog_App("Plot saved to" << path << widthPx << "x" << heightPx);
    return true;
}
