#pragma once
#include "measure/errors.hpp"
#include "measure/interaction.hpp"
#include "measure/measurement.hpp"
#include "measure/view_transform.hpp"

#include <QImage>
#include <QObject>
#include <QPointF>
#include <QString>
#include <QVector>
#include <functional>
#include <optional>

namespace controller {

// 标定/测量引擎：持有图像、视图变换、标定、历史与进行中的交互状态。
// 所有修改都在事件线程上同步完成；渲染层只读快照。
class MeasureEngine : public QObject {
    Q_OBJECT
public:
    struct CalibrationInput {
        double realLength = 0.0;
        QString units;
    };
    // 第二个标定点落下后询问实际长度；返回 nullopt 表示用户取消
    using CalibrationPrompt = std::function<std::optional<CalibrationInput>(
        double pixelDistance, const QString& suggestedUnits)>;

    static constexpr double kWheelZoomIn  = 1.25;
    static constexpr double kWheelZoomOut = 0.8;

    explicit MeasureEngine(QObject* parent = nullptr);

    // ---- 图像 ----
    measure::MeasureError setImage(const QImage& img);
    const QImage& image() const { return img_; }
    bool hasImage() const { return !img_.isNull(); }
    bool containsImagePoint(const QPointF& p) const;

    // ---- 视图 ----
    const measure::ViewTransform& view() const { return view_; }
    void resetView();
    void zoomAt(double factor, const QPointF& anchorView);

    // ---- 工具模式 ----
    void selectTool(measure::ToolMode mode);
    measure::ToolMode toolMode() const { return state_.mode; }
    const QVector<QPointF>& pendingPoints() const { return state_.pendingPoints; }
    const measure::InteractionState& interaction() const { return state_; }

    void setGuideAxes(const measure::GuideAxes& axes);
    measure::GuideAxes guideAxes() const { return axes_; }
    std::optional<measure::GuideState> guides() const;

    // ---- 指针/键盘手势（视图坐标） ----
    void pointerPress(Qt::MouseButton button, const QPointF& viewPos);
    void pointerMove(const QPointF& viewPos);
    void pointerRelease(Qt::MouseButton button, const QPointF& viewPos);
    void wheel(int angleDeltaY, const QPointF& viewPos);
    void setSpaceHeld(bool held) { spaceHeld_ = held; }
    bool spaceHeld() const { return spaceHeld_; }
    bool isPanning() const { return panning_; }

    bool clickAt(const QPointF& viewPos); // 左键加点，返回是否被接受
    void finishOrCancel();                // 右键
    void cancel();                        // Esc

    // ---- 标定 ----
    void setCalibrationPrompt(CalibrationPrompt prompt) { prompt_ = std::move(prompt); }
    void setDefaultUnits(const QString& units);
    QString suggestedUnits() const;
    const measure::Calibration& calibration() const { return cal_; }
    measure::MeasureError finishCalibration(
        const QPointF& a, const QPointF& b, double realLength, const QString& units);
    void recomputeAll();

    // ---- 历史 ----
    const QVector<measure::Measurement>& history() const { return history_; }
    bool undoLast();
    int deleteAt(const QVector<int>& indices);
    void clearMeasurements();
    void clearAll();

    // ---- 只读文本 ----
    QString scaleText() const;
    QString cursorText(const QPointF& imagePos) const;

signals:
    void historyChanged();
    void measurementAdded(int index);
    void calibrationChanged(double scaleUnitsPerPixel, const QString& units);
    void imageChanged();
    void interactionChanged(); // 模式 / 待定点 / 参考线
    void viewChanged();
    void status(const QString& msg, int ms = 3000);
    void failed(const measure::MeasureError& err);

private:
    void fail(const measure::MeasureError& err);
    void resetToIdle();
    void completeCalibrationPair();
    void appendMeasurement(measure::MeasureKind kind, const QVector<QPointF>& points);

private:
    QImage img_;
    measure::ViewTransform view_;
    measure::Calibration cal_;
    QVector<measure::Measurement> history_;
    measure::InteractionState state_;
    measure::GuideAxes axes_;

    CalibrationPrompt prompt_;
    QString defaultUnits_ = QStringLiteral("mm");

    // 平移子状态，与工具模式正交
    bool spaceHeld_ = false;
    bool panning_   = false;
    Qt::MouseButton panButton_ = Qt::NoButton;
    QPointF dragOriginW_;
    QPointF panOrigin_;
};

} // namespace controller
