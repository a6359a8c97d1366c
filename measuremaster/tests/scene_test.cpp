#include "controller/measure_engine.hpp"
#include "render/scene.hpp"
#include "render/scene_painter.hpp"

#include <QPainter>
#include <gtest/gtest.h>

using namespace render;
using measure::MeasureKind;
using measure::ToolMode;
using measure::ViewTransform;

namespace {

constexpr double kEps = 1e-9;

void expectNear(const QPointF& a, const QPointF& b) {
    EXPECT_NEAR(a.x(), b.x(), kEps);
    EXPECT_NEAR(a.y(), b.y(), kEps);
}

ViewTransform zoomed(double z, const QPointF& pan) {
    ViewTransform t;
    t.setZoomAnchored(z, {0, 0});
    t.setPan(pan);
    return t;
}

} // namespace

TEST(SceneTest, LineLabelSitsAtMidpoint) {
    const measure::Calibration cal;
    const auto m = measure::makeMeasurement(MeasureKind::Line, {{10, 20}, {30, 20}}, cal);

    Scene s;
    drawMeasurement(s, m, ViewTransform::identity());
    ASSERT_EQ(s.paths.size(), 1);
    ASSERT_EQ(s.labels.size(), 1);
    EXPECT_EQ(s.paths[0].size(), 2);
    expectNear(s.labels[0].anchor, QPointF(26, 14));
    EXPECT_EQ(s.labels[0].text, "20.0 px");
}

TEST(SceneTest, GeometryFollowsViewTransform) {
    const measure::Calibration cal;
    const auto m = measure::makeMeasurement(MeasureKind::Line, {{10, 20}, {30, 20}}, cal);

    Scene s;
    drawMeasurement(s, m, zoomed(2.0, {5, -5}));
    expectNear(s.paths[0][0], QPointF(25, 35));
    expectNear(s.paths[0][1], QPointF(65, 35));
    // 标签偏移是屏幕像素，不随缩放
    expectNear(s.labels[0].anchor, QPointF(45 + 6, 35 - 6));
}

TEST(SceneTest, PolylineLabelSitsAtHalfway) {
    const measure::Calibration cal;
    const auto m =
        measure::makeMeasurement(MeasureKind::Polyline, {{0, 0}, {3, 0}, {3, 4}}, cal);

    Scene s;
    drawMeasurement(s, m, ViewTransform::identity());
    ASSERT_EQ(s.paths.size(), 1);
    EXPECT_EQ(s.paths[0].size(), 3);
    expectNear(s.labels[0].anchor, QPointF(3 + 6, 0.5 - 6));
}

TEST(SceneTest, MalformedLineIsSkipped) {
    measure::Measurement m;
    m.kind   = MeasureKind::Line;
    m.points = {{1, 1}};
    Scene s;
    drawMeasurement(s, m, ViewTransform::identity());
    EXPECT_TRUE(s.isEmpty());
}

TEST(SceneTest, PendingSinglePointShowsNumberedHandle) {
    const measure::Calibration cal;
    Scene s;
    drawPendingPreview(s, ToolMode::Line, {{40, 40}}, cal, ViewTransform::identity(), true);
    EXPECT_TRUE(s.paths.isEmpty());
    ASSERT_EQ(s.handles.size(), 1);
    ASSERT_EQ(s.labels.size(), 1);
    EXPECT_EQ(s.labels[0].text, "1");
    expectNear(s.labels[0].anchor, QPointF(48, 32));
}

TEST(SceneTest, PendingPairShowsSegmentAndLength) {
    measure::Calibration cal;
    cal.scaleUnitsPerPixel = 0.5;
    cal.units              = "mm";
    Scene s;
    drawPendingPreview(
        s, ToolMode::Calibrate, {{0, 0}, {40, 0}}, cal, ViewTransform::identity(), false);
    EXPECT_TRUE(s.handles.isEmpty());
    ASSERT_EQ(s.paths.size(), 1);
    ASSERT_EQ(s.labels.size(), 1);
    EXPECT_EQ(s.labels[0].text, "20.00 mm");
    expectNear(s.labels[0].anchor, QPointF(26, -6));
}

TEST(SceneTest, PendingPolylineShowsRunningLengthAtLastPoint) {
    const measure::Calibration cal;
    Scene s;
    drawPendingPreview(
        s, ToolMode::Polyline, {{0, 0}, {3, 0}, {3, 4}}, cal, ViewTransform::identity(), true);
    ASSERT_EQ(s.paths.size(), 1);
    EXPECT_EQ(s.handles.size(), 3);
    // 3 个编号 + 1 个长度
    ASSERT_EQ(s.labels.size(), 4);
    EXPECT_EQ(s.labels.back().text, "7.0 px");
    expectNear(s.labels.back().anchor, QPointF(11, -4));
}

TEST(SceneTest, GuidesSpanViewport) {
    measure::GuideState g;
    g.anchor = {100, 50};
    g.thick  = true;

    const GuideLines lines = drawGuides(g, ViewTransform::identity(), QSizeF(800, 600));
    ASSERT_EQ(lines.lines.size(), 4);
    EXPECT_TRUE(lines.thick);
    EXPECT_EQ(lines.lines[0], QLineF(0, 50, 800, 50));
    EXPECT_EQ(lines.lines[1], QLineF(100, 0, 100, 600));
    EXPECT_EQ(lines.lines[2], QLineF(100 - 1600, 50 + 1600, 100 + 1600, 50 - 1600));
    EXPECT_EQ(lines.lines[3], QLineF(100 - 1600, 50 - 1600, 100 + 1600, 50 + 1600));
}

TEST(SceneTest, DisabledGuideAxesAreOmitted) {
    measure::GuideState g;
    g.anchor               = {10, 10};
    g.axes.horizontal      = false;
    g.axes.diagonal45      = false;
    g.axes.diagonal135     = false;
    const GuideLines lines = drawGuides(g, ViewTransform::identity(), QSizeF(100, 100));
    ASSERT_EQ(lines.lines.size(), 1);
    EXPECT_EQ(lines.lines[0], QLineF(10, 0, 10, 100));
}

TEST(SceneTest, BuildSceneCollectsEverything) {
    controller::MeasureEngine engine;
    QImage img(120, 120, QImage::Format_RGB32);
    img.fill(Qt::gray);
    engine.setImage(img);

    engine.selectTool(ToolMode::Line);
    engine.clickAt({10, 10});
    engine.clickAt({50, 10});
    engine.clickAt({60, 60});

    const Scene live = buildScene(engine, engine.view(), QSizeF(400, 300));
    EXPECT_EQ(live.paths.size(), 1);     // 只有已完成的线段
    EXPECT_EQ(live.handles.size(), 1);   // 一个待定点
    EXPECT_EQ(live.labels.size(), 2);    // 长度 + 编号
    EXPECT_EQ(live.guides.lines.size(), 4);
    EXPECT_TRUE(live.guides.thick);

    SceneOptions exportOpt;
    exportOpt.guides  = false;
    exportOpt.handles = false;
    const Scene out   = buildScene(engine, ViewTransform::identity(), QSizeF(120, 120), exportOpt);
    EXPECT_TRUE(out.handles.isEmpty());
    EXPECT_TRUE(out.guides.lines.isEmpty());
    EXPECT_EQ(out.labels.size(), 1);
}

TEST(ScenePainterTest, GuidePensThinOutStyle) {
    const auto thick = guidePens(true);
    EXPECT_DOUBLE_EQ(thick.first.widthF(), 4.0);
    EXPECT_DOUBLE_EQ(thick.second.widthF(), 2.0);

    const auto thin = guidePens(false);
    EXPECT_NEAR(thin.first.widthF(), 4.0 / 3.0, 1e-9);
    EXPECT_NEAR(thin.second.widthF(), 0.7, 1e-9);
    EXPECT_TRUE(thin.first.isCosmetic());
    EXPECT_EQ(thin.first.style(), Qt::CustomDashLine);
}

TEST(ScenePainterTest, PaintsIntoImage) {
    QImage canvas(100, 100, QImage::Format_RGB32);
    canvas.fill(Qt::white);

    Scene s;
    s.paths << QPolygonF(QVector<QPointF>{{10, 50}, {90, 50}});
    QPainter p(&canvas);
    paintScene(p, s);
    p.end();

    EXPECT_NE(canvas.pixel(50, 50), QColor(Qt::white).rgb());
    EXPECT_EQ(canvas.pixel(50, 10), QColor(Qt::white).rgb());
}
