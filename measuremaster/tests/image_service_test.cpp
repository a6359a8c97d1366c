#include "controller/settings.hpp"
#include "logger/core.hpp"
#include "service/image.hpp"

#include <QClipboard>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QMimeData>
#include <QTemporaryDir>
#include <QUrl>
#include <gtest/gtest.h>

using measure::MeasureError;
using service::ImageService;

namespace {

QString writePng(const QTemporaryDir& dir, const QString& name, const QSize& size) {
    QImage img(size, QImage::Format_RGB32);
    img.fill(Qt::red);
    const QString path = QDir(dir.path()).filePath(name);
    EXPECT_TRUE(img.save(path));
    return path;
}

} // namespace

TEST(ImageServiceTest, DecodeMissingFileReportsReason) {
    QString why;
    const QImage img = ImageService::decodeFile("/nonexistent/measuremaster.png", &why);
    EXPECT_TRUE(img.isNull());
    EXPECT_FALSE(why.isEmpty());
}

TEST(ImageServiceTest, IsImageFileBySuffix) {
    EXPECT_TRUE(ImageService::isImageFile("shot.png"));
    EXPECT_TRUE(ImageService::isImageFile("Shot.PNG"));
    EXPECT_FALSE(ImageService::isImageFile("notes.txt"));
    EXPECT_FALSE(ImageService::isImageFile("noext"));
}

TEST(ImageServiceTest, OpenPathEmitsImage) {
    QTemporaryDir dir;
    const QString path = writePng(dir, "a.png", {30, 20});

    ImageService svc;
    QImage got;
    QObject::connect(&svc, &ImageService::imageReady, [&](const QImage& img) { got = img; });

    ASSERT_TRUE(svc.openPath(path).isSuccess());
    EXPECT_EQ(got.size(), QSize(30, 20));
    EXPECT_EQ(controller::AppSettings::instance().lastImageDir(), QFileInfo(path).absolutePath());
}

TEST(ImageServiceTest, OpenGarbageIsDecodeFailure) {
    QTemporaryDir dir;
    const QString path = QDir(dir.path()).filePath("broken.png");
    {
        QFile f(path);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("definitely not a png");
    }

    ImageService svc;
    int ready = 0;
    QString lastStatus;
    QObject::connect(&svc, &ImageService::imageReady, [&](const QImage&) { ++ready; });
    QObject::connect(&svc, &ImageService::status, [&](const QString& s, int) { lastStatus = s; });

    const auto err = svc.openPath(path);
    EXPECT_EQ(err.code, MeasureError::Code::DecodeFailure);
    EXPECT_EQ(ready, 0);
    EXPECT_EQ(lastStatus, "Failed to load image");
}

TEST(ImageServiceTest, MimeDataPrefersBitmap) {
    QImage img(12, 8, QImage::Format_RGB32);
    img.fill(Qt::blue);
    QMimeData mime;
    mime.setImageData(img);
    EXPECT_EQ(ImageService::imageFromMimeData(&mime).size(), QSize(12, 8));
}

TEST(ImageServiceTest, MimeDataFallsBackToFileUrl) {
    QTemporaryDir dir;
    const QString path = writePng(dir, "copied.png", {7, 9});

    QMimeData mime;
    mime.setUrls({QUrl("https://example.com/remote.png"), QUrl::fromLocalFile(path)});
    EXPECT_EQ(ImageService::imageFromMimeData(&mime).size(), QSize(7, 9));
}

TEST(ImageServiceTest, MimeDataWithoutImage) {
    QMimeData mime;
    mime.setText("hello");
    EXPECT_TRUE(ImageService::imageFromMimeData(&mime).isNull());
    EXPECT_TRUE(ImageService::imageFromMimeData(nullptr).isNull());
}

TEST(ImageServiceTest, PasteFromClipboard) {
    QClipboard* cb = QGuiApplication::clipboard();
    ASSERT_NE(cb, nullptr);

    ImageService svc;
    QImage got;
    QObject::connect(&svc, &ImageService::imageReady, [&](const QImage& img) { got = img; });

    auto* text = new QMimeData;
    text->setText("no image here");
    cb->setMimeData(text);
    EXPECT_EQ(svc.pasteFromClipboard().code, MeasureError::Code::ClipboardEmpty);
    EXPECT_TRUE(got.isNull());

    QImage img(16, 16, QImage::Format_RGB32);
    img.fill(Qt::green);
    cb->setImage(img);
    EXPECT_TRUE(svc.pasteFromClipboard().isSuccess());
    EXPECT_EQ(got.size(), QSize(16, 16));
}

TEST(ImageServiceTest, EmptyClipboardIsLoggedAsWarning) {
    auto* text = new QMimeData;
    text->setText("still no image");
    QGuiApplication::clipboard()->setMimeData(text);

    QStringList lines;
    auto conn = QObject::connect(
        &logger::Logger::instance(), &logger::Logger::lineLogged,
        [&](const QString& l) { lines << l; });
    ImageService svc;
    const auto err = svc.pasteFromClipboard();
    QObject::disconnect(conn);

    EXPECT_EQ(err.code, MeasureError::Code::ClipboardEmpty);
    ASSERT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines[0].contains("[WARN] Clipboard does not contain an image"));
}
