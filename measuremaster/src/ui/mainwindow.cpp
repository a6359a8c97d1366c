#include "mainwindow.hpp"
#include "controller/settings.hpp"
#include "logger/core.hpp"
#include "ui_mainwindow.h"

#include <QAction>
#include <QCheckBox>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QItemSelectionModel>
#include <QKeyEvent>
#include <QLineEdit>
#include <QListWidget>
#include <QStatusBar>
#include <QTextEdit>
#include <QTimer>

#include "ui/image_canvas.hpp"

using ui::MainWindow;
using measure::ToolMode;

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , ui_(std::make_unique<::Ui::MainWindow>()) {
    ui_->setupUi(this);
    setWindowTitle(QStringLiteral("MeasureMaster - Calibrate & Measure on Image"));

    // 日志面板：Logger 可能在任意线程写
    connect(
        &logger::Logger::instance(), &logger::Logger::lineLogged, this, &MainWindow::appendLog,
        Qt::QueuedConnection);

    setupActions();
    wireButtonsToActions();

    // 历史列表里 Delete/Backspace 删除选中
    ui_->history_list->installEventFilter(this);

    for (auto* chk : {ui_->guide_h_check, ui_->guide_v_check, ui_->guide_d45_check,
                      ui_->guide_d135_check})
        connect(chk, &QCheckBox::toggled, this, &MainWindow::onGuidesToggled);

    // 比例尺标签 300 ms 刷新一次
    scaleTimer_ = new QTimer(this);
    connect(scaleTimer_, &QTimer::timeout, this, &MainWindow::refreshScale);
    scaleTimer_->start(300);

    statusBar()->showMessage(tr("Ready"), 1200);
}

MainWindow::~MainWindow() = default;

void MainWindow::attachEngine(controller::MeasureEngine* engine) {
    if (engine_)
        disconnect(engine_, nullptr, this, nullptr);
    engine_ = engine;
    ui_->canvas->setEngine(engine_);
    if (!engine_)
        return;

    connect(engine_, &controller::MeasureEngine::historyChanged, this, &MainWindow::refreshHistory);
    connect(engine_, &controller::MeasureEngine::status, this, &MainWindow::setStatus);
    connect(engine_, &controller::MeasureEngine::calibrationChanged, this, &MainWindow::refreshScale);

    engine_->setDefaultUnits(controller::AppSettings::instance().defaultUnits());
    engine_->setCalibrationPrompt([this](double dpx, const QString& units) {
        return promptCalibration(dpx, units);
    });

    loadGuideSettings();
    refreshHistory();
    refreshScale();
    ui_->canvas->setFocus();
}

/* ---------------- 外部输入（更新 UI） ---------------- */
void MainWindow::appendLog(const QString& line) {
    if (auto* te = ui_->log_text)
        te->append(line);
}

void MainWindow::setStatus(const QString& msg, int ms) { statusBar()->showMessage(msg, ms); }

void MainWindow::showPasteTip() {
    setStatus(tr("Tip: Copy a screenshot, then press Ctrl+V here. Or use Ctrl+O to open a file."), 0);
}

void MainWindow::refreshHistory() {
    auto* list = ui_->history_list;
    list->clear();
    if (!engine_)
        return;
    // 行号与历史下标一一对应
    for (const auto& m : engine_->history()) {
        list->addItem(QString("[%1] %2: %3 (%4 pts)")
                          .arg(m.timestamp.toString("HH:mm:ss"), measure::kindName(m.kind),
                               m.displayLabel)
                          .arg(m.points.size()));
    }
    if (list->count() > 0)
        list->scrollToBottom();
}

void MainWindow::refreshScale() {
    if (engine_)
        ui_->scale_label->setText(engine_->scaleText());
}

/* ---------------- 参考线 ---------------- */
void MainWindow::loadGuideSettings() {
    auto& s = controller::AppSettings::instance();
    const QSignalBlocker bh(ui_->guide_h_check);
    const QSignalBlocker bv(ui_->guide_v_check);
    const QSignalBlocker b45(ui_->guide_d45_check);
    const QSignalBlocker b135(ui_->guide_d135_check);
    ui_->guide_h_check->setChecked(s.guideHorizontal());
    ui_->guide_v_check->setChecked(s.guideVertical());
    ui_->guide_d45_check->setChecked(s.guideDiagonal45());
    ui_->guide_d135_check->setChecked(s.guideDiagonal135());
    onGuidesToggled();
}

void MainWindow::onGuidesToggled() {
    measure::GuideAxes axes;
    axes.horizontal  = ui_->guide_h_check->isChecked();
    axes.vertical    = ui_->guide_v_check->isChecked();
    axes.diagonal45  = ui_->guide_d45_check->isChecked();
    axes.diagonal135 = ui_->guide_d135_check->isChecked();

    auto& s = controller::AppSettings::instance();
    s.setGuideHorizontal(axes.horizontal);
    s.setGuideVertical(axes.vertical);
    s.setGuideDiagonal45(axes.diagonal45);
    s.setGuideDiagonal135(axes.diagonal135);

    if (engine_)
        engine_->setGuideAxes(axes);
}

/* ---------------- 对话框 ---------------- */
std::optional<controller::MeasureEngine::CalibrationInput>
    MainWindow::promptCalibration(double pixelDistance, const QString& suggestedUnits) {
    bool ok           = false;
    const double real = QInputDialog::getDouble(
        this, tr("Calibration"),
        tr("Pixel distance: %1 px\nReal length:").arg(pixelDistance, 0, 'f', 2),
        controller::AppSettings::instance().defaultLength(), 0.000001, 1e12, 6, &ok);
    if (!ok)
        return std::nullopt;

    // 单位对话框取消不算放弃标定，交给引擎回退
    bool okUnits        = false;
    const QString units = QInputDialog::getText(
        this, tr("Calibration"), tr("Units (e.g., mm, cm, m, in):"), QLineEdit::Normal,
        suggestedUnits, &okUnits);

    controller::MeasureEngine::CalibrationInput in;
    in.realLength = real;
    in.units      = okUnits ? units : QString();
    return in;
}

void MainWindow::openImageDialog() {
    auto& s            = controller::AppSettings::instance();
    const QString path = QFileDialog::getOpenFileName(
        this, tr("Open image"), s.lastImageDir(),
        tr("Images (*.png *.jpg *.jpeg *.bmp *.gif *.tif *.tiff *.webp)"));
    if (path.isEmpty())
        return;
    emit sigOpenPathRequested(path);
}

void MainWindow::exportCsvDialog() {
    if (!engine_ || engine_->history().isEmpty()) {
        setStatus(tr("Nothing to export"));
        return;
    }
    auto& s            = controller::AppSettings::instance();
    const QString path = QFileDialog::getSaveFileName(
        this, tr("Export CSV"), QDir(s.lastExportDir()).filePath("measurements.csv"),
        tr("CSV Files (*.csv)"));
    if (path.isEmpty())
        return;
    s.setLastExportDir(QFileInfo(path).absolutePath());
    emit sigExportCsvRequested(path);
}

void MainWindow::exportImageDialog() {
    if (!engine_ || !engine_->hasImage()) {
        setStatus(tr("Nothing to export: no image"));
        return;
    }
    auto& s      = controller::AppSettings::instance();
    QString path = QFileDialog::getSaveFileName(
        this, tr("Export annotated image"), QDir(s.lastExportDir()).filePath("annotated.png"),
        tr("PNG (*.png);;JPEG (*.jpg *.jpeg)"));
    if (path.isEmpty())
        return;
    if (QFileInfo(path).suffix().isEmpty())
        path += QStringLiteral(".png");
    s.setLastExportDir(QFileInfo(path).absolutePath());
    emit sigExportImageRequested(path);
}

void MainWindow::deleteSelected() {
    if (!engine_)
        return;
    QVector<int> rows;
    for (const auto& idx : ui_->history_list->selectionModel()->selectedRows())
        rows << idx.row();
    if (!rows.isEmpty())
        engine_->deleteAt(rows);
}

bool MainWindow::eventFilter(QObject* obj, QEvent* e) {
    if (obj == ui_->history_list && e->type() == QEvent::KeyPress) {
        const auto* ke = static_cast<QKeyEvent*>(e);
        if (ke->key() == Qt::Key_Delete || ke->key() == Qt::Key_Backspace) {
            deleteSelected();
            return true;
        }
    }
    return QMainWindow::eventFilter(obj, e);
}

/* ---------------- 装配 ---------------- */
static QAction* ensureAction(QAction* act, const QKeySequence& ks, const QString& tip) {
    if (!act)
        return nullptr;
    if (!ks.isEmpty())
        act->setShortcut(ks);
    if (!tip.isEmpty())
        act->setToolTip(tip);
    return act;
}

void MainWindow::setupActions() {
    ensureAction(ui_->actionOpen, QKeySequence::Open, tr("Open image (Ctrl+O)"));
    ensureAction(ui_->actionPaste, QKeySequence::Paste, tr("Paste image (Ctrl+V)"));
    ensureAction(ui_->actionExportCsv, QKeySequence(Qt::CTRL | Qt::Key_E), tr("Export CSV (Ctrl+E)"));
    ensureAction(
        ui_->actionExportImage, QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_E),
        tr("Export annotated image (Ctrl+Shift+E)"));
    ensureAction(ui_->actionCalibrate, QKeySequence(Qt::Key_C), tr("Calibrate (C)"));
    ensureAction(ui_->actionLine, QKeySequence(Qt::Key_L), tr("Line (L)"));
    ensureAction(ui_->actionPolyline, QKeySequence(Qt::Key_P), tr("Polyline (P)"));
    ensureAction(ui_->actionCancel, QKeySequence(Qt::Key_Escape), tr("Cancel (Esc)"));
    ensureAction(ui_->actionUndo, QKeySequence::Undo, tr("Undo last (Ctrl+Z)"));
    ensureAction(ui_->actionDeleteSelected, {}, tr("Delete selected"));
    ensureAction(ui_->actionClearMeasurements, {}, tr("Clear measurements"));
    ensureAction(ui_->actionClearAll, {}, tr("Clear image + measurements"));
    ensureAction(ui_->actionResetView, QKeySequence(Qt::Key_R), tr("Reset view (R)"));

    connect(ui_->actionOpen, &QAction::triggered, this, &MainWindow::openImageDialog);
    connect(ui_->actionPaste, &QAction::triggered, this, &MainWindow::sigPasteRequested);
    connect(ui_->actionExportCsv, &QAction::triggered, this, &MainWindow::exportCsvDialog);
    connect(ui_->actionExportImage, &QAction::triggered, this, &MainWindow::exportImageDialog);
    connect(ui_->actionDeleteSelected, &QAction::triggered, this, &MainWindow::deleteSelected);

    // 以下直接落到引擎
    auto onEngine = [this](auto fn) {
        return [this, fn] {
            if (engine_)
                fn(*engine_);
        };
    };
    connect(ui_->actionCalibrate, &QAction::triggered, this,
            onEngine([](auto& e) { e.selectTool(ToolMode::Calibrate); }));
    connect(ui_->actionLine, &QAction::triggered, this,
            onEngine([](auto& e) { e.selectTool(ToolMode::Line); }));
    connect(ui_->actionPolyline, &QAction::triggered, this,
            onEngine([](auto& e) { e.selectTool(ToolMode::Polyline); }));
    connect(ui_->actionCancel, &QAction::triggered, this, onEngine([](auto& e) { e.cancel(); }));
    connect(ui_->actionUndo, &QAction::triggered, this, onEngine([](auto& e) { e.undoLast(); }));
    connect(ui_->actionClearMeasurements, &QAction::triggered, this,
            onEngine([](auto& e) { e.clearMeasurements(); }));
    connect(ui_->actionClearAll, &QAction::triggered, this, onEngine([](auto& e) { e.clearAll(); }));
    connect(ui_->actionResetView, &QAction::triggered, this, onEngine([](auto& e) { e.resetView(); }));
}

void MainWindow::wireButtonsToActions() {
    connect(ui_->calibrate_button, &QPushButton::clicked, ui_->actionCalibrate, &QAction::trigger);
    connect(ui_->line_button, &QPushButton::clicked, ui_->actionLine, &QAction::trigger);
    connect(ui_->polyline_button, &QPushButton::clicked, ui_->actionPolyline, &QAction::trigger);
    connect(ui_->paste_button, &QPushButton::clicked, ui_->actionPaste, &QAction::trigger);
    connect(ui_->open_button, &QPushButton::clicked, ui_->actionOpen, &QAction::trigger);
    connect(ui_->export_csv_button, &QPushButton::clicked, ui_->actionExportCsv, &QAction::trigger);
    connect(ui_->export_image_button, &QPushButton::clicked, ui_->actionExportImage, &QAction::trigger);
    connect(ui_->reset_view_button, &QPushButton::clicked, ui_->actionResetView, &QAction::trigger);
    connect(ui_->undo_button, &QPushButton::clicked, ui_->actionUndo, &QAction::trigger);
    connect(ui_->delete_button, &QPushButton::clicked, ui_->actionDeleteSelected, &QAction::trigger);
    connect(ui_->clear_measurements_button, &QPushButton::clicked, ui_->actionClearMeasurements, &QAction::trigger);
    connect(ui_->clear_all_button, &QPushButton::clicked, ui_->actionClearAll, &QAction::trigger);
}
