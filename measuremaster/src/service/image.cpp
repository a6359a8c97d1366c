#include "service/image.hpp"
#include "controller/settings.hpp"
#include "logger/core.hpp"

#include <QClipboard>
#include <QFileInfo>
#include <QGuiApplication>
#include <QImageReader>
#include <QMimeData>
#include <QUrl>

using measure::MeasureError;

namespace service {

ImageService::ImageService(QObject* parent)
    : QObject(parent) {}

QImage ImageService::decodeFile(const QString& path, QString* err) {
    QImageReader reader(path);
    reader.setAutoTransform(true); // 手机截图/照片带 EXIF 方向
    QImage img = reader.read();
    if (img.isNull() && err)
        *err = reader.errorString();
    return img;
}

bool ImageService::isImageFile(const QString& path) {
    const QByteArray suffix = QFileInfo(path).suffix().toLower().toLatin1();
    return !suffix.isEmpty() && QImageReader::supportedImageFormats().contains(suffix);
}

QImage ImageService::imageFromMimeData(const QMimeData* mime) {
    if (!mime)
        return {};
    if (mime->hasImage()) {
        const QImage img = qvariant_cast<QImage>(mime->imageData());
        if (!img.isNull())
            return img;
    }
    // 文件管理器里“复制文件”得到的是 URL
    if (mime->hasUrls()) {
        for (const QUrl& url : mime->urls()) {
            if (!url.isLocalFile())
                continue;
            const QString path = url.toLocalFile();
            if (!isImageFile(path))
                continue;
            const QImage img = decodeFile(path);
            if (!img.isNull())
                return img;
        }
    }
    return {};
}

MeasureError ImageService::openPath(const QString& path) {
    QString why;
    const QImage img = decodeFile(path, &why);
    if (img.isNull()) {
        LOGW(QString("Failed to load image %1: %2").arg(path, why));
        emit status(tr("Failed to load image"));
        return MeasureError::make(MeasureError::Code::DecodeFailure, tr("Failed to load image"));
    }

    controller::AppSettings::instance().setLastImageDir(QFileInfo(path).absolutePath());
    LOGI(QString("Opened %1").arg(path));
    emit imageReady(img);
    return MeasureError::ok();
}

MeasureError ImageService::pasteFromClipboard() {
    const QClipboard* cb = QGuiApplication::clipboard();
    const QImage img     = cb ? imageFromMimeData(cb->mimeData()) : QImage();
    if (img.isNull()) {
        LOGW("Clipboard does not contain an image");
        emit status(tr("Clipboard does not contain an image"));
        return MeasureError::make(
            MeasureError::Code::ClipboardEmpty, tr("Clipboard does not contain an image"));
    }
    LOGI(QString("Pasted image %1x%2").arg(img.width()).arg(img.height()));
    emit imageReady(img);
    return MeasureError::ok();
}

} // namespace service
