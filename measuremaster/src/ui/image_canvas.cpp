#include "image_canvas.hpp"
#include "controller/measure_engine.hpp"
#include "render/scene.hpp"
#include "render/scene_painter.hpp"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QWheelEvent>

using ui::ImageCanvas;
using measure::ToolMode;

ImageCanvas::ImageCanvas(QWidget* parent)
    : QWidget(parent) {
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(200, 150);
    setContextMenuPolicy(Qt::NoContextMenu); // 右键留给“结束折线”
}

void ImageCanvas::setEngine(controller::MeasureEngine* engine) {
    if (engine_)
        disconnect(engine_, nullptr, this, nullptr);
    engine_ = engine;
    if (!engine_)
        return;

    auto repaint = [this] {
        updateCursor();
        update();
    };
    connect(engine_, &controller::MeasureEngine::imageChanged, this, repaint);
    connect(engine_, &controller::MeasureEngine::viewChanged, this, repaint);
    connect(engine_, &controller::MeasureEngine::interactionChanged, this, repaint);
    connect(engine_, &controller::MeasureEngine::historyChanged, this, repaint);
    connect(engine_, &controller::MeasureEngine::calibrationChanged, this, repaint);
    update();
}

/* ===== 绘制 ===== */
void ImageCanvas::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.fillRect(rect(), QColor(30, 30, 30));
    if (!engine_ || !engine_->hasImage())
        return;

    const auto& view = engine_->view();
    const QImage& img = engine_->image();
    const QRectF target(view.pan(), QSizeF(img.width(), img.height()) * view.zoom());
    p.drawImage(target, img, QRectF(img.rect()));

    const render::Scene scene = render::buildScene(*engine_, view, QSizeF(size()));
    render::paintScene(p, scene);
}

/* ===== 交互 ===== */
void ImageCanvas::wheelEvent(QWheelEvent* e) {
    if (engine_)
        engine_->wheel(e->angleDelta().y(), e->position());
    e->accept();
}

void ImageCanvas::mousePressEvent(QMouseEvent* e) {
    setFocus(Qt::MouseFocusReason);
    if (!engine_)
        return;
    engine_->pointerPress(e->button(), e->position());
    updateCursor();
    e->accept();
}

void ImageCanvas::mouseReleaseEvent(QMouseEvent* e) {
    if (!engine_)
        return;
    engine_->pointerRelease(e->button(), e->position());
    updateCursor();
}

void ImageCanvas::mouseMoveEvent(QMouseEvent* e) {
    if (engine_)
        engine_->pointerMove(e->position());
}

void ImageCanvas::keyPressEvent(QKeyEvent* e) {
    if (e->key() == Qt::Key_Space && engine_) {
        if (!e->isAutoRepeat()) {
            engine_->setSpaceHeld(true);
            updateCursor();
        }
        e->accept();
        return;
    }
    QWidget::keyPressEvent(e);
}

void ImageCanvas::keyReleaseEvent(QKeyEvent* e) {
    if (e->key() == Qt::Key_Space && engine_) {
        if (!e->isAutoRepeat()) {
            engine_->setSpaceHeld(false);
            updateCursor();
        }
        e->accept();
        return;
    }
    QWidget::keyReleaseEvent(e);
}

void ImageCanvas::focusOutEvent(QFocusEvent* e) {
    // 失焦时收不到 Space 松开
    if (engine_)
        engine_->setSpaceHeld(false);
    updateCursor();
    QWidget::focusOutEvent(e);
}

void ImageCanvas::updateCursor() {
    if (!engine_) {
        unsetCursor();
        return;
    }
    if (engine_->isPanning())
        setCursor(Qt::ClosedHandCursor);
    else if (engine_->spaceHeld())
        setCursor(Qt::OpenHandCursor);
    else if (engine_->toolMode() != ToolMode::Idle)
        setCursor(Qt::CrossCursor);
    else
        setCursor(Qt::ArrowCursor);
}
