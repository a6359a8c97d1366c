#include "service/export.hpp"
#include "controller/measure_engine.hpp"
#include "logger/core.hpp"
#include "render/scene.hpp"
#include "render/scene_painter.hpp"

#include <QFile>
#include <QFileInfo>
#include <QImageWriter>
#include <QPainter>
#include <QStringList>
#include <QTextStream>

using measure::MeasureError;

namespace service {

namespace {

constexpr char kDelimiter  = ';';
constexpr auto kLineEnding = "\r\n";

QString csvField(const QString& s) {
    const bool needQuote = s.contains(QLatin1Char(kDelimiter)) || s.contains(QLatin1Char('"'))
                           || s.contains(QLatin1Char('\r')) || s.contains(QLatin1Char('\n'));
    if (!needQuote)
        return s;
    QString q = s;
    q.replace(QLatin1String("\""), QLatin1String("\"\""));
    return QLatin1Char('"') + q + QLatin1Char('"');
}

QString csvRow(const QStringList& fields) {
    QStringList out;
    out.reserve(fields.size());
    for (const auto& f : fields)
        out << csvField(f);
    return out.join(QLatin1Char(kDelimiter)) + QLatin1String(kLineEnding);
}

QString pointsField(const QVector<QPointF>& pts) {
    QStringList parts;
    parts.reserve(pts.size());
    for (const auto& p : pts)
        parts << QString("%1,%2").arg(p.x(), 0, 'f', 2).arg(p.y(), 0, 'f', 2);
    return parts.join(QLatin1Char('|'));
}

} // namespace

QString csvText(const QVector<measure::Measurement>& history) {
    QString out = csvRow(
        {"timestamp", "kind", "units", "length_value", "length_label", "points"});
    for (const auto& m : history) {
        out += csvRow({
            m.timestamp.toString(Qt::ISODateWithMs),
            measure::kindName(m.kind),
            m.units,
            QString::number(m.lengthValue, 'f', 6),
            m.displayLabel,
            pointsField(m.points),
        });
    }
    return out;
}

MeasureError exportCsv(const QString& path, const QVector<measure::Measurement>& history) {
    if (history.isEmpty()) {
        LOGW("CSV export skipped: history is empty");
        return MeasureError::make(MeasureError::Code::NothingToExport, QObject::tr("Nothing to export"));
    }

    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOGW(QString("CSV export: open('%1') failed: %2").arg(path, f.errorString()));
        return MeasureError::make(
            MeasureError::Code::ExportIO, QObject::tr("Failed to write %1").arg(QFileInfo(path).fileName()));
    }
    QTextStream os(&f);
    os.setEncoding(QStringConverter::Utf8);
    os << csvText(history);
    os.flush();
    if (os.status() != QTextStream::Ok || f.error() != QFileDevice::NoError) {
        LOGW(QString("CSV export: write('%1') failed: %2").arg(path, f.errorString()));
        return MeasureError::make(
            MeasureError::Code::ExportIO, QObject::tr("Failed to write %1").arg(QFileInfo(path).fileName()));
    }
    f.close();

    LOGI(QString("Exported %1 items to %2").arg(history.size()).arg(path));
    return MeasureError::ok();
}

QImage renderAnnotatedImage(const controller::MeasureEngine& engine) {
    if (!engine.hasImage())
        return {};

    const QImage& src = engine.image();
    // 索引色/灰度图无法直接作画
    QImage out = src.convertToFormat(
        src.hasAlphaChannel() ? QImage::Format_ARGB32_Premultiplied : QImage::Format_RGB32);
    // 粘贴来的 HiDPI 截图带 dpr，不清掉的话 QPainter 会把图像坐标再缩放一次
    out.setDevicePixelRatio(1.0);

    render::SceneOptions opt;
    opt.guides  = false;
    opt.handles = false;
    const render::Scene scene =
        render::buildScene(engine, measure::ViewTransform::identity(), out.size(), opt);

    QPainter p(&out);
    render::paintScene(p, scene);
    p.end();
    return out;
}

MeasureError saveAnnotatedImage(
    const QString& path, const controller::MeasureEngine& engine, int jpegQuality) {
    if (!engine.hasImage()) {
        LOGW("Annotated export skipped: no image");
        return MeasureError::make(MeasureError::Code::NoImage, QObject::tr("Nothing to export: no image"));
    }

    const QImage annotated = renderAnnotatedImage(engine);
    const QString suffix   = QFileInfo(path).suffix().toLower();

    QImageWriter writer(path);
    if (suffix == QLatin1String("jpg") || suffix == QLatin1String("jpeg"))
        writer.setQuality(jpegQuality);
    if (!writer.write(annotated)) {
        LOGW(QString("Annotated export: write('%1') failed: %2").arg(path, writer.errorString()));
        return MeasureError::make(
            MeasureError::Code::ExportIO, QObject::tr("Failed to save annotated image"));
    }

    LOGI(QString("Annotated image saved: %1").arg(path));
    return MeasureError::ok();
}

} // namespace service
