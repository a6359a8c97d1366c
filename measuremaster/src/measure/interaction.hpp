#pragma once
#include <QPointF>
#include <QString>
#include <QVector>

namespace measure {

enum class ToolMode { Idle, Calibrate, Line, Polyline };

QString toolModeName(ToolMode mode);

// 每种模式允许累积的点数上限；-1 表示不限（折线，右键结束）
int maxPendingPoints(ToolMode mode);

// 参考线：锚定在最后一次接受的点上，四个方向独立开关
struct GuideAxes {
    bool horizontal  = true;
    bool vertical    = true;
    bool diagonal45  = true; // 左下 -> 右上
    bool diagonal135 = true; // 左上 -> 右下

    bool any() const { return horizontal || vertical || diagonal45 || diagonal135; }
};

// 交给渲染层的参考线快照
struct GuideState {
    QPointF anchor; // 图像坐标
    bool thick = false; // 放点过程中为粗线；仅选中工具未放点时为细线
    GuideAxes axes;
};

// 进行中的交互：工具模式 + 待定点 + 参考线锚点
struct InteractionState {
    ToolMode mode = ToolMode::Idle;
    QVector<QPointF> pendingPoints;
    bool hasAnchor = false;
    QPointF guideAnchor;

    void clearPending() { pendingPoints.clear(); }
    void clearAnchor() {
        hasAnchor   = false;
        guideAnchor = {};
    }
    bool pendingFull() const {
        const int cap = maxPendingPoints(mode);
        return cap >= 0 && pendingPoints.size() >= cap;
    }
};

} // namespace measure
