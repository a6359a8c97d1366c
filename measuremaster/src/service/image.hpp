#pragma once
#include "measure/errors.hpp"

#include <QImage>
#include <QObject>
#include <QString>

class QMimeData;

namespace service {

// 只负责“取图”：文件 / 剪贴板 -> QImage，成功后 imageReady
class ImageService : public QObject {
    Q_OBJECT
public:
    explicit ImageService(QObject* parent = nullptr);

    // 按 EXIF 方向解码；失败时 *err 写入解码器给出的原因
    static QImage decodeFile(const QString& path, QString* err = nullptr);

    // 剪贴板内容 -> 图像：优先位图数据，其次第一个本地图片文件 URL
    static QImage imageFromMimeData(const QMimeData* mime);

    static bool isImageFile(const QString& path);

public slots:
    measure::MeasureError openPath(const QString& path);
    measure::MeasureError pasteFromClipboard();

signals:
    void imageReady(const QImage& img);
    void status(const QString& msg, int ms = 3000);
};

} // namespace service
