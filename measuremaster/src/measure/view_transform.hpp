#pragma once
#include <QPointF>

namespace measure {

// 视图坐标 <-> 图像坐标
//   view  = image * zoom + pan
//   image = (view - pan) / zoom
class ViewTransform {
public:
    static constexpr double kMinZoom = 0.05;
    static constexpr double kMaxZoom = 40.0;

    ViewTransform() = default;
    static ViewTransform identity() { return {}; }

    double zoom() const { return zoom_; }
    QPointF pan() const { return pan_; }

    QPointF imageToView(const QPointF& p) const;
    QPointF viewToImage(const QPointF& p) const;

    // 以 anchor（视图坐标）为锚点缩放：锚点下的图像点缩放前后保持不动
    void setZoomAnchored(double newZoom, const QPointF& anchorView);
    void zoomBy(double factor, const QPointF& anchorView) {
        setZoomAnchored(zoom_ * factor, anchorView);
    }

    void resetView();
    void panBy(const QPointF& delta) { pan_ += delta; }
    void setPan(const QPointF& pan) { pan_ = pan; }

private:
    double zoom_ = 1.0;
    QPointF pan_{0, 0};
};

} // namespace measure
