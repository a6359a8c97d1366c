#include "measure/geometry.hpp"

#include <cmath>

namespace measure {

double pixelDistance(const QPointF& a, const QPointF& b) {
    return std::hypot(a.x() - b.x(), a.y() - b.y());
}

double pathLength(const QVector<QPointF>& points) {
    double total = 0.0;
    for (int i = 1; i < points.size(); ++i)
        total += pixelDistance(points[i - 1], points[i]);
    return total;
}

QPointF halfwayPoint(const QVector<QPointF>& points) {
    if (points.isEmpty())
        return {};
    if (points.size() == 1)
        return points.front();

    const QPointF fallback = (points.front() + points.back()) * 0.5;
    const double total     = pathLength(points);
    if (total <= 0.0)
        return fallback;

    const double half = total / 2.0;
    double acc        = 0.0;
    for (int i = 1; i < points.size(); ++i) {
        const QPointF& a = points[i - 1];
        const QPointF& b = points[i];
        const double seg = pixelDistance(a, b);
        if (acc + seg >= half) {
            const double t = seg > 0.0 ? (half - acc) / seg : 0.5;
            return QPointF(a.x() + (b.x() - a.x()) * t, a.y() + (b.y() - a.y()) * t);
        }
        acc += seg;
    }
    return fallback;
}

} // namespace measure
