#include "scene.hpp"
#include "controller/measure_engine.hpp"
#include "measure/geometry.hpp"

#include <algorithm>

namespace render {

namespace {

QPolygonF toView(const QVector<QPointF>& pts, const measure::ViewTransform& t) {
    QPolygonF poly;
    poly.reserve(pts.size());
    for (const auto& p : pts)
        poly << t.imageToView(p);
    return poly;
}

} // namespace

void drawMeasurement(Scene& out, const measure::Measurement& m, const measure::ViewTransform& t) {
    if (m.points.size() < 2)
        return;
    if (m.kind == measure::MeasureKind::Line && m.points.size() != 2)
        return;

    out.paths << toView(m.points, t);

    const QPointF at = m.kind == measure::MeasureKind::Line
                           ? (m.points[0] + m.points[1]) * 0.5
                           : measure::halfwayPoint(m.points);
    out.labels << TextLabel{t.imageToView(at) + kLabelOffset, m.displayLabel};
}

void drawPendingPreview(
    Scene& out, measure::ToolMode mode, const QVector<QPointF>& pending,
    const measure::Calibration& cal, const measure::ViewTransform& t, bool withHandles) {
    if (pending.isEmpty())
        return;

    if (withHandles) {
        for (int i = 0; i < pending.size(); ++i) {
            const QPointF v = t.imageToView(pending[i]);
            out.handles << v;
            out.labels << TextLabel{v + kPreviewLabelOffset, QString::number(i + 1)};
        }
    }

    const bool pair = mode == measure::ToolMode::Line || mode == measure::ToolMode::Calibrate;
    if (pair && pending.size() == 2) {
        const QPointF a = pending[0], b = pending[1];
        out.paths << toView(pending, t);
        const double len = measure::pixelDistance(a, b) * cal.scaleUnitsPerPixel;
        out.labels << TextLabel{
            t.imageToView((a + b) * 0.5) + kLabelOffset, measure::formatLength(len, cal.units)};
    } else if (mode == measure::ToolMode::Polyline && pending.size() >= 2) {
        out.paths << toView(pending, t);
        const double len = measure::pathLength(pending) * cal.scaleUnitsPerPixel;
        out.labels << TextLabel{
            t.imageToView(pending.back()) + kPreviewLabelOffset,
            measure::formatLength(len, cal.units)};
    }
}

GuideLines drawGuides(
    const measure::GuideState& g, const measure::ViewTransform& t, const QSizeF& viewport) {
    GuideLines out;
    out.thick = g.thick;

    const QPointF a = t.imageToView(g.anchor);
    const double w  = viewport.width();
    const double h  = viewport.height();
    const double L  = std::max(w, h) * 2.0;

    if (g.axes.horizontal)
        out.lines << QLineF(0, a.y(), w, a.y());
    if (g.axes.vertical)
        out.lines << QLineF(a.x(), 0, a.x(), h);
    if (g.axes.diagonal45) // 视图 y 轴向下：左下 -> 右上
        out.lines << QLineF(a.x() - L, a.y() + L, a.x() + L, a.y() - L);
    if (g.axes.diagonal135)
        out.lines << QLineF(a.x() - L, a.y() - L, a.x() + L, a.y() + L);
    return out;
}

Scene buildScene(
    const controller::MeasureEngine& engine, const measure::ViewTransform& t,
    const QSizeF& viewport, const SceneOptions& opt) {
    Scene scene;
    for (const auto& m : engine.history())
        drawMeasurement(scene, m, t);

    drawPendingPreview(
        scene, engine.toolMode(), engine.pendingPoints(), engine.calibration(), t, opt.handles);

    if (opt.guides) {
        if (const auto g = engine.guides())
            scene.guides = drawGuides(*g, t, viewport);
    }
    return scene;
}

} // namespace render
