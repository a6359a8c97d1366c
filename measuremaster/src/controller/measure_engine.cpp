#include "controller/measure_engine.hpp"
#include "logger/core.hpp"
#include "measure/geometry.hpp"

#include <algorithm>
#include <cmath>

using measure::MeasureError;
using measure::MeasureKind;
using measure::ToolMode;

namespace controller {

MeasureEngine::MeasureEngine(QObject* parent)
    : QObject(parent) {}

/* ===== 图像 & 视图 ===== */

MeasureError MeasureEngine::setImage(const QImage& img) {
    if (img.isNull()) {
        const auto err =
            MeasureError::make(MeasureError::Code::DecodeFailure, tr("No usable image"));
        fail(err);
        return err;
    }
    img_ = img;
    view_.resetView();
    state_.clearPending();
    state_.clearAnchor();
    panning_ = false;

    const QString msg =
        tr("Image loaded: %1x%2 px").arg(img_.width()).arg(img_.height());
    LOGI(msg);
    emit imageChanged();
    emit viewChanged();
    emit interactionChanged();
    emit status(msg);
    return MeasureError::ok();
}

bool MeasureEngine::containsImagePoint(const QPointF& p) const {
    if (img_.isNull())
        return false;
    return p.x() >= 0 && p.y() >= 0 && p.x() < img_.width() && p.y() < img_.height();
}

void MeasureEngine::resetView() {
    view_.resetView();
    emit viewChanged();
}

void MeasureEngine::zoomAt(double factor, const QPointF& anchorView) {
    if (img_.isNull())
        return;
    view_.zoomBy(factor, anchorView);
    emit viewChanged();
}

/* ===== 工具模式 ===== */

void MeasureEngine::selectTool(ToolMode mode) {
    state_.clearPending();
    state_.mode = mode;
    if (mode == ToolMode::Idle)
        state_.clearAnchor();

    switch (mode) {
    case ToolMode::Calibrate:
        emit status(tr("Calibration: click two points, then enter known length"));
        break;
    case ToolMode::Line: emit status(tr("Line: click two points to measure")); break;
    case ToolMode::Polyline: emit status(tr("Polyline: click points; right-click to finish")); break;
    case ToolMode::Idle: break;
    }
    LOGD(QString("tool -> %1").arg(measure::toolModeName(mode)));
    emit interactionChanged();
}

void MeasureEngine::setGuideAxes(const measure::GuideAxes& axes) {
    axes_ = axes;
    emit interactionChanged();
}

std::optional<measure::GuideState> MeasureEngine::guides() const {
    if (state_.mode == ToolMode::Idle || !state_.hasAnchor)
        return std::nullopt;
    measure::GuideState g;
    g.anchor = state_.guideAnchor;
    g.thick  = !state_.pendingPoints.isEmpty();
    g.axes   = axes_;
    return g;
}

void MeasureEngine::resetToIdle() {
    state_.clearPending();
    state_.mode = ToolMode::Idle;
    state_.clearAnchor();
    emit interactionChanged();
}

/* ===== 手势 ===== */

void MeasureEngine::pointerPress(Qt::MouseButton button, const QPointF& viewPos) {
    if (button == Qt::MiddleButton || (button == Qt::LeftButton && spaceHeld_)) {
        panning_     = true;
        panButton_   = button;
        dragOriginW_ = viewPos;
        panOrigin_   = view_.pan();
        return;
    }
    if (button == Qt::RightButton) {
        finishOrCancel();
        return;
    }
    if (button == Qt::LeftButton)
        clickAt(viewPos);
}

void MeasureEngine::pointerMove(const QPointF& viewPos) {
    if (panning_) {
        // 相对拖拽起点的累计位移
        view_.setPan(panOrigin_ + (viewPos - dragOriginW_));
        emit viewChanged();
        return;
    }
    if (!img_.isNull())
        emit status(cursorText(view_.viewToImage(viewPos)), 0);
}

void MeasureEngine::pointerRelease(Qt::MouseButton button, const QPointF& viewPos) {
    if (!panning_ || button != panButton_)
        return;
    view_.setPan(panOrigin_ + (viewPos - dragOriginW_));
    panning_   = false;
    panButton_ = Qt::NoButton;
    emit viewChanged();
}

void MeasureEngine::wheel(int angleDeltaY, const QPointF& viewPos) {
    if (img_.isNull() || angleDeltaY == 0)
        return;
    zoomAt(angleDeltaY > 0 ? kWheelZoomIn : kWheelZoomOut, viewPos);
}

bool MeasureEngine::clickAt(const QPointF& viewPos) {
    if (img_.isNull() || state_.mode == ToolMode::Idle)
        return false;
    const QPointF p = view_.viewToImage(viewPos);
    if (!containsImagePoint(p))
        return false;

    state_.guideAnchor = p;
    state_.hasAnchor   = true;
    state_.pendingPoints.append(p);

    if (state_.pendingFull()) {
        if (state_.mode == ToolMode::Calibrate) {
            completeCalibrationPair();
            return true;
        }
        // Line：出结果后保持 Line 模式，方便连续测量
        const QVector<QPointF> pts = state_.pendingPoints;
        state_.clearPending();
        appendMeasurement(MeasureKind::Line, pts);
    }
    emit interactionChanged();
    return true;
}

void MeasureEngine::finishOrCancel() {
    if (state_.mode == ToolMode::Polyline && state_.pendingPoints.size() >= 2) {
        const QVector<QPointF> pts = state_.pendingPoints;
        state_.clearPending();
        appendMeasurement(MeasureKind::Polyline, pts);
        emit interactionChanged();
        return;
    }
    resetToIdle();
}

void MeasureEngine::cancel() { resetToIdle(); }

/* ===== 标定 ===== */

void MeasureEngine::setDefaultUnits(const QString& units) {
    const QString u = units.trimmed();
    defaultUnits_   = u.isEmpty() ? QStringLiteral("mm") : u;
}

QString MeasureEngine::suggestedUnits() const {
    return cal_.isCalibrated() ? cal_.units : defaultUnits_;
}

void MeasureEngine::completeCalibrationPair() {
    const QPointF a = state_.pendingPoints[0];
    const QPointF b = state_.pendingPoints[1];
    const double dpx = measure::pixelDistance(a, b);
    if (dpx <= 0.0) {
        resetToIdle();
        fail(MeasureError::make(
            MeasureError::Code::ZeroDistance, tr("Calibration failed: zero distance")));
        return;
    }

    // 询问期间两个点保持可见，画布会显示预览线段
    emit interactionChanged();
    std::optional<CalibrationInput> input;
    if (prompt_)
        input = prompt_(dpx, suggestedUnits());
    if (!input) {
        resetToIdle();
        LOGI("Calibration canceled");
        emit status(tr("Calibration canceled"));
        return;
    }
    finishCalibration(a, b, input->realLength, input->units);
}

MeasureError MeasureEngine::finishCalibration(
    const QPointF& a, const QPointF& b, double realLength, const QString& units) {
    const double dpx = measure::pixelDistance(a, b);
    if (dpx <= 0.0) {
        resetToIdle();
        const auto err = MeasureError::make(
            MeasureError::Code::ZeroDistance, tr("Calibration failed: zero distance"));
        fail(err);
        return err;
    }
    if (!std::isfinite(realLength) || realLength <= 0.0) {
        resetToIdle();
        const auto err = MeasureError::make(
            MeasureError::Code::InvalidLength,
            tr("Calibration failed: real length must be a positive number"));
        fail(err);
        return err;
    }

    QString u = units.trimmed();
    if (u.isEmpty())
        u = cal_.isCalibrated() ? cal_.units : QStringLiteral("units");

    // 标定与历史都改完再通知，观察者不会看到新单位配旧标签
    cal_.scaleUnitsPerPixel = realLength / dpx;
    cal_.units              = u;
    measure::recomputeAll(history_, cal_);
    resetToIdle();
    if (!history_.isEmpty())
        emit historyChanged();

    const QString msg = tr("Calibrated: %1 %2/px (dpx=%3)")
                            .arg(cal_.scaleUnitsPerPixel, 0, 'f', 6)
                            .arg(cal_.units)
                            .arg(dpx, 0, 'f', 2);
    LOGI(msg);
    emit calibrationChanged(cal_.scaleUnitsPerPixel, cal_.units);
    emit status(msg);
    return MeasureError::ok();
}

void MeasureEngine::recomputeAll() {
    if (history_.isEmpty())
        return;
    // 每次都从图像坐标重新推导，不复用旧的换算值
    measure::recomputeAll(history_, cal_);
    emit historyChanged();
}

/* ===== 历史 ===== */

void MeasureEngine::appendMeasurement(MeasureKind kind, const QVector<QPointF>& points) {
    history_.append(measure::makeMeasurement(kind, points, cal_));
    const int idx = history_.size() - 1;
    const auto& m = history_.back();
    LOGI(QString("Added %1: %2 (%3 pts)")
             .arg(measure::kindName(m.kind), m.displayLabel)
             .arg(m.points.size()));
    emit measurementAdded(idx);
    emit historyChanged();
    emit status(tr("Measured: %1").arg(m.displayLabel));
}

bool MeasureEngine::undoLast() {
    if (history_.isEmpty())
        return false;
    history_.removeLast();
    LOGI("Last measurement undone");
    emit historyChanged();
    emit status(tr("Last measurement undone"));
    return true;
}

int MeasureEngine::deleteAt(const QVector<int>& indices) {
    QVector<int> order = indices;
    std::sort(order.begin(), order.end());
    order.erase(std::unique(order.begin(), order.end()), order.end());

    // 从大到小删除，剩余下标保持有效
    int removed = 0;
    for (auto it = order.crbegin(); it != order.crend(); ++it) {
        const int idx = *it;
        if (idx < 0 || idx >= history_.size())
            continue;
        history_.removeAt(idx);
        ++removed;
    }
    if (removed == 0)
        return 0;

    LOGI(QString("Deleted %1 measurement(s)").arg(removed));
    emit historyChanged();
    emit status(tr("Selected measurement(s) deleted"));
    return removed;
}

void MeasureEngine::clearMeasurements() {
    const bool hadHistory = !history_.isEmpty();
    history_.clear();
    state_.clearPending();
    state_.clearAnchor();
    emit interactionChanged();
    if (!hadHistory)
        return;
    LOGI("Measurements cleared");
    emit historyChanged();
    emit status(tr("Measurements cleared"));
}

void MeasureEngine::clearAll() {
    img_ = QImage();
    view_.resetView();
    history_.clear();
    state_.clearPending();
    state_.clearAnchor();
    panning_ = false;

    LOGI("Image and measurements cleared");
    emit imageChanged();
    emit viewChanged();
    emit interactionChanged();
    emit historyChanged();
    emit status(tr("Image and measurements cleared"));
}

/* ===== 文本 ===== */

QString MeasureEngine::scaleText() const {
    return tr("Scale: %1 %2/px, units=%3")
        .arg(cal_.scaleUnitsPerPixel, 0, 'f', 6)
        .arg(cal_.units, cal_.units);
}

QString MeasureEngine::cursorText(const QPointF& imagePos) const {
    return tr("Cursor: %1, %2 px | Scale: %3 %4/px")
        .arg(imagePos.x(), 0, 'f', 1)
        .arg(imagePos.y(), 0, 'f', 1)
        .arg(cal_.scaleUnitsPerPixel, 0, 'f', 6)
        .arg(cal_.units);
}

void MeasureEngine::fail(const MeasureError& err) {
    LOGW(err.toString());
    emit status(err.message);
    emit failed(err);
}

} // namespace controller
