#pragma once
#include <QWidget>

class QPainter;
class QKeyEvent;
class QMouseEvent;
class QWheelEvent;

namespace controller {
class MeasureEngine;
}

namespace ui {

// 画布只做两件事：把输入事件转成引擎手势，把引擎快照画出来
class ImageCanvas : public QWidget {
    Q_OBJECT
public:
    explicit ImageCanvas(QWidget* parent = nullptr);

    void setEngine(controller::MeasureEngine* engine);
    controller::MeasureEngine* engine() const { return engine_; }

protected:
    void paintEvent(QPaintEvent*) override;
    void wheelEvent(QWheelEvent*) override;
    void mousePressEvent(QMouseEvent*) override;
    void mouseReleaseEvent(QMouseEvent*) override;
    void mouseMoveEvent(QMouseEvent*) override;
    void keyPressEvent(QKeyEvent*) override;
    void keyReleaseEvent(QKeyEvent*) override;
    void focusOutEvent(QFocusEvent*) override;

private:
    void updateCursor();

private:
    controller::MeasureEngine* engine_ = nullptr;
};

} // namespace ui
