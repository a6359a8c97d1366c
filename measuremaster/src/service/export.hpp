#pragma once
#include "measure/errors.hpp"
#include "measure/measurement.hpp"

#include <QImage>
#include <QString>
#include <QVector>

namespace controller {
class MeasureEngine;
}

namespace service {

// 分号分隔，首行表头，CRLF 行尾；含 ; " CR LF 的字段加引号
QString csvText(const QVector<measure::Measurement>& history);

// 历史为空 -> NothingToExport；写失败 -> ExportIO
measure::MeasureError exportCsv(const QString& path, const QVector<measure::Measurement>& history);

// 原图 + 全部测量 + 当前已成形的待定几何，单位视图变换，不画参考线与圆点
QImage renderAnnotatedImage(const controller::MeasureEngine& engine);

// 格式由后缀决定（png/jpg/jpeg），jpegQuality 仅对 JPEG 生效
measure::MeasureError saveAnnotatedImage(
    const QString& path, const controller::MeasureEngine& engine, int jpegQuality = 95);

} // namespace service
