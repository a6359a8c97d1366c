#pragma once
#include "scene.hpp"

#include <QPen>
#include <utility>

class QPainter;

namespace render {

QPen outlinePen(); // 黑色半透明外描边
QPen innerPen();   // 青色内描边

// 参考线虚线笔 {外, 内}；细线模式为粗线宽度的三分之一
std::pair<QPen, QPen> guidePens(bool thick);

// 圆角暗底白字标签，anchor 为左下角
void drawFloatingText(QPainter& p, const QPointF& anchor, const QString& text);

void paintScene(QPainter& p, const Scene& scene);

} // namespace render
