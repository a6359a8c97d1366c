#pragma once
#include "measure/interaction.hpp"
#include "measure/measurement.hpp"
#include "measure/view_transform.hpp"

#include <QLineF>
#include <QPolygonF>
#include <QSizeF>
#include <QString>
#include <QVector>

namespace controller {
class MeasureEngine;
}

namespace render {

// 以下坐标全部为视图坐标（导出时视图变换为单位变换，即图像坐标）

// 浮动标签：anchor 为标签框左下角
struct TextLabel {
    QPointF anchor;
    QString text;
};

struct GuideLines {
    QVector<QLineF> lines;
    bool thick = false;
};

// 一帧的绘制指令，不依赖任何 QPainter
struct Scene {
    QVector<QPolygonF> paths;   // 双描边线段/折线
    QVector<QPointF> handles;   // 待定点圆点
    QVector<TextLabel> labels;
    GuideLines guides;

    bool isEmpty() const {
        return paths.isEmpty() && handles.isEmpty() && labels.isEmpty() && guides.lines.isEmpty();
    }
};

struct SceneOptions {
    bool guides  = true; // 导出时关闭
    bool handles = true; // 导出时关闭
};

inline const QPointF kLabelOffset{6, -6};
inline const QPointF kPreviewLabelOffset{8, -8};
constexpr double kHandleRadius = 5.0;

// 一条已完成测量：路径 + 中点/半程点处的标签
void drawMeasurement(Scene& out, const measure::Measurement& m, const measure::ViewTransform& t);

// 进行中的几何：编号圆点，Line/Calibrate 两点时的线段与长度，Polyline >=2 点时的路径与累计长度
void drawPendingPreview(
    Scene& out, measure::ToolMode mode, const QVector<QPointF>& pending,
    const measure::Calibration& cal, const measure::ViewTransform& t, bool withHandles);

// 贯穿整个视口的参考线；对角线长度取视口长边的两倍
GuideLines drawGuides(
    const measure::GuideState& g, const measure::ViewTransform& t, const QSizeF& viewport);

Scene buildScene(
    const controller::MeasureEngine& engine, const measure::ViewTransform& t,
    const QSizeF& viewport, const SceneOptions& opt = {});

} // namespace render
