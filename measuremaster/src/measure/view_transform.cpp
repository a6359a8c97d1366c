#include "measure/view_transform.hpp"

#include <algorithm>
#include <cmath>

namespace measure {

namespace {
// 防止除零：zoom 永远不会按 0 参与运算
constexpr double kZoomEpsilon = 1e-9;
} // namespace

QPointF ViewTransform::imageToView(const QPointF& p) const {
    return QPointF(p.x() * zoom_ + pan_.x(), p.y() * zoom_ + pan_.y());
}

QPointF ViewTransform::viewToImage(const QPointF& p) const {
    const double inv = 1.0 / std::max(zoom_, kZoomEpsilon);
    return QPointF((p.x() - pan_.x()) * inv, (p.y() - pan_.y()) * inv);
}

void ViewTransform::setZoomAnchored(double newZoom, const QPointF& anchorView) {
    if (!std::isfinite(newZoom))
        return;
    const QPointF beforeI = viewToImage(anchorView);
    zoom_                 = std::clamp(newZoom, kMinZoom, kMaxZoom);
    const QPointF afterW  = imageToView(beforeI);
    pan_ += (anchorView - afterW);
}

void ViewTransform::resetView() {
    zoom_ = 1.0;
    pan_  = {0, 0};
}

} // namespace measure
