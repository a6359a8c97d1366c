#pragma once
#include <QPointF>
#include <QVector>

namespace measure {

// 两点欧氏距离（像素，不做单位换算）
double pixelDistance(const QPointF& a, const QPointF& b);

// 折线总长：相邻点距离之和；单点为 0
double pathLength(const QVector<QPointF>& points);

// 沿路径弧长一半处的点
// 退化情况（总长 <= 0）返回首尾中点
QPointF halfwayPoint(const QVector<QPointF>& points);

} // namespace measure
