#pragma once
#include "controller/measure_engine.hpp"

#include <QMainWindow>
#include <memory>
#include <optional>

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
class QTimer;
QT_END_NAMESPACE

namespace ui {

class MainWindow final : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    // 绑定引擎：画布、历史列表、标定弹窗、参考线开关都接到它上面
    void attachEngine(controller::MeasureEngine* engine);

signals:
    // —— 用户输出（对话框已确认的路径）——
    void sigOpenPathRequested(const QString& path);
    void sigPasteRequested();
    void sigExportCsvRequested(const QString& path);
    void sigExportImageRequested(const QString& path);

public slots:
    void appendLog(const QString& line);
    void setStatus(const QString& msg, int ms = 3000);
    void showPasteTip();
    void refreshHistory();
    void refreshScale();

protected:
    bool eventFilter(QObject* obj, QEvent* e) override;

private:
    void setupActions();
    void wireButtonsToActions();
    void loadGuideSettings();
    void onGuidesToggled();

    void openImageDialog();
    void exportCsvDialog();
    void exportImageDialog();
    void deleteSelected();

    std::optional<controller::MeasureEngine::CalibrationInput>
        promptCalibration(double pixelDistance, const QString& suggestedUnits);

private:
    std::unique_ptr<Ui::MainWindow> ui_;
    controller::MeasureEngine* engine_ = nullptr;
    QTimer* scaleTimer_                = nullptr;
};

} // namespace ui
