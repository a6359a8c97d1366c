#include "controller/measure_engine.hpp"
#include "controller/settings.hpp"
#include "logger/core.hpp"
#include "service/export.hpp"
#include "service/image.hpp"
#include "ui/mainwindow.hpp"

#include <QApplication>
#include <QFileInfo>
#include <QTimer>

int main(int argc, char* argv[]) {
    controller::AppSettings::initOrgApp("MeasureMaster", "MeasureMaster");
    QApplication app(argc, argv);

    // 1) 尽早接管 Qt 日志
    logger::Logger::installQtHandler();
    auto& settings = controller::AppSettings::instance();
    auto& log      = logger::Logger::instance();
    log.setMinLevel(logger::Logger::levelFromString(settings.logLevel()));
    if (!settings.logFile().isEmpty() && !log.setLogFile(settings.logFile()))
        LOGW(QString("Cannot open log file %1").arg(settings.logFile()));

    controller::MeasureEngine engine;
    service::ImageService images;
    ui::MainWindow w;
    w.attachEngine(&engine);

    // 2) 取图：文件 / 剪贴板 -> 引擎
    QObject::connect(&w, &ui::MainWindow::sigOpenPathRequested, &images, &service::ImageService::openPath);
    QObject::connect(&w, &ui::MainWindow::sigPasteRequested, &images, &service::ImageService::pasteFromClipboard);
    QObject::connect(&images, &service::ImageService::imageReady, &engine, [&engine](const QImage& img) {
        engine.setImage(img);
    });
    QObject::connect(&images, &service::ImageService::status, &w, &ui::MainWindow::setStatus);

    // 3) 导出
    QObject::connect(&w, &ui::MainWindow::sigExportCsvRequested, &w, [&](const QString& path) {
        const auto err = service::exportCsv(path, engine.history());
        if (!err.isSuccess()) {
            w.setStatus(err.message);
            return;
        }
        w.setStatus(QObject::tr("Exported %1 items to %2")
                        .arg(engine.history().size())
                        .arg(QFileInfo(path).fileName()));
    });
    QObject::connect(&w, &ui::MainWindow::sigExportImageRequested, &w, [&](const QString& path) {
        const auto err = service::saveAnnotatedImage(path, engine, settings.jpegQuality());
        if (!err.isSuccess()) {
            w.setStatus(err.message);
            return;
        }
        w.setStatus(QObject::tr("Annotated image saved: %1").arg(QFileInfo(path).fileName()));
    });

    w.show();
    LOGI("App started");

    // 4) 启动后自动尝试粘贴一次
    if (settings.autoPaste()) {
        QTimer::singleShot(100, &w, [&] {
            if (!images.pasteFromClipboard().isSuccess())
                w.showPasteTip();
        });
    } else {
        w.showPasteTip();
    }

    const int rc = app.exec();
    settings.sync();
    return rc;
}
