#include "measure/view_transform.hpp"

#include <gtest/gtest.h>
#include <limits>

using measure::ViewTransform;

namespace {

constexpr double kEps = 1e-9;

void expectNear(const QPointF& a, const QPointF& b, double eps = kEps) {
    EXPECT_NEAR(a.x(), b.x(), eps);
    EXPECT_NEAR(a.y(), b.y(), eps);
}

} // namespace

TEST(ViewTransformTest, IdentityByDefault) {
    const ViewTransform t;
    EXPECT_DOUBLE_EQ(t.zoom(), 1.0);
    EXPECT_EQ(t.pan(), QPointF(0, 0));
    expectNear(t.imageToView({12.5, 7}), {12.5, 7});
}

TEST(ViewTransformTest, InverseLawHoldsAcrossZoomAndPan) {
    const QVector<QPointF> samples{{0, 0}, {1, 1}, {123.4, -56.7}, {1e4, 3e3}};
    for (double z : {0.05, 0.3, 1.0, 2.5, 17.0, 40.0}) {
        ViewTransform t;
        t.setZoomAnchored(z, {0, 0});
        t.setPan({-311.5, 42.25});
        for (const auto& p : samples)
            expectNear(t.viewToImage(t.imageToView(p)), p, 1e-6);
    }
}

TEST(ViewTransformTest, ZoomKeepsAnchorFixed) {
    ViewTransform t;
    t.setPan({20, -10});
    const QPointF anchor(250, 180);
    const QPointF before = t.viewToImage(anchor);

    t.zoomBy(1.25, anchor);
    expectNear(t.viewToImage(anchor), before, 1e-9);
    EXPECT_DOUBLE_EQ(t.zoom(), 1.25);

    t.zoomBy(0.8, anchor);
    expectNear(t.viewToImage(anchor), before, 1e-9);
}

TEST(ViewTransformTest, ZoomIsClamped) {
    ViewTransform t;
    for (int i = 0; i < 100; ++i)
        t.zoomBy(1.25, {10, 10});
    EXPECT_DOUBLE_EQ(t.zoom(), ViewTransform::kMaxZoom);

    for (int i = 0; i < 200; ++i)
        t.zoomBy(0.8, {10, 10});
    EXPECT_DOUBLE_EQ(t.zoom(), ViewTransform::kMinZoom);
}

TEST(ViewTransformTest, NonFiniteZoomIsIgnored) {
    ViewTransform t;
    t.setZoomAnchored(2.0, {0, 0});
    t.setZoomAnchored(std::numeric_limits<double>::quiet_NaN(), {5, 5});
    EXPECT_DOUBLE_EQ(t.zoom(), 2.0);
}

TEST(ViewTransformTest, ResetRestoresIdentity) {
    ViewTransform t;
    t.zoomBy(3.0, {100, 100});
    t.panBy({5, 5});
    t.resetView();
    EXPECT_DOUBLE_EQ(t.zoom(), 1.0);
    EXPECT_EQ(t.pan(), QPointF(0, 0));
}
