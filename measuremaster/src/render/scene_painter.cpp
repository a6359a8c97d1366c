#include "scene_painter.hpp"

#include <QFontMetricsF>
#include <QPainter>
#include <QPainterPath>
#include <algorithm>

namespace render {

QPen outlinePen() {
    QPen pen(QColor(0, 0, 0, 220), 4);
    pen.setCosmetic(true);
    return pen;
}

QPen innerPen() {
    QPen pen(QColor(0, 200, 255), 2);
    pen.setCosmetic(true);
    return pen;
}

std::pair<QPen, QPen> guidePens(bool thick) {
    constexpr double kOuterThick = 4.0;
    constexpr double kInnerThick = 2.0;
    const double outerW = thick ? kOuterThick : std::max(1.0, kOuterThick / 3.0);
    const double innerW = thick ? kInnerThick : std::max(0.7, kInnerThick / 3.0);
    const QVector<qreal> dash{6, 6};

    QPen outer(QColor(0, 0, 0, 200));
    outer.setCosmetic(true);
    outer.setWidthF(outerW);
    outer.setDashPattern(dash);

    QPen inner(QColor(255, 255, 255, 230));
    inner.setCosmetic(true);
    inner.setWidthF(innerW);
    inner.setDashPattern(dash);
    return {outer, inner};
}

void drawFloatingText(QPainter& p, const QPointF& anchor, const QString& text) {
    QFont f = p.font();
    f.setPointSizeF(10);
    p.setFont(f);

    const QFontMetricsF fm(f);
    const double w = fm.horizontalAdvance(text) + 8;
    const double h = fm.height() + 2;
    const QRectF box(anchor.x(), anchor.y() - h, w, h);

    QPainterPath path;
    path.addRoundedRect(box, 4, 4);
    p.setPen(Qt::NoPen);
    p.setBrush(QColor(0, 0, 0, 180));
    p.drawPath(path);

    p.setPen(QColor(255, 255, 255));
    p.drawText(box.adjusted(4, 0, -4, 0), Qt::AlignVCenter, text);
}

void paintScene(QPainter& p, const Scene& scene) {
    p.save();
    p.setRenderHints(QPainter::Antialiasing | QPainter::TextAntialiasing);

    // 路径：先外描边再内描边
    p.setBrush(Qt::NoBrush);
    for (const auto& poly : scene.paths) {
        p.setPen(outlinePen());
        p.drawPolyline(poly);
        p.setPen(innerPen());
        p.drawPolyline(poly);
    }

    p.setPen(Qt::NoPen);
    p.setBrush(QColor(0, 200, 255, 160));
    for (const auto& c : scene.handles)
        p.drawEllipse(c, kHandleRadius, kHandleRadius);

    for (const auto& l : scene.labels)
        drawFloatingText(p, l.anchor, l.text);

    if (!scene.guides.lines.isEmpty()) {
        const auto pens = guidePens(scene.guides.thick);
        p.setBrush(Qt::NoBrush);
        for (const auto& line : scene.guides.lines) {
            p.setPen(pens.first);
            p.drawLine(line);
            p.setPen(pens.second);
            p.drawLine(line);
        }
    }
    p.restore();
}

} // namespace render
