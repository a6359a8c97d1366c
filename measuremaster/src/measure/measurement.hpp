#pragma once
#include <QDateTime>
#include <QPointF>
#include <QString>
#include <QVector>

namespace measure {

enum class MeasureKind { Line, Polyline };

// "line" / "polyline"，CSV 与历史列表共用
QString kindName(MeasureKind kind);

// 标定状态：全局唯一，默认 1.0 px/px
struct Calibration {
    static constexpr const char* kPixelUnits = "px"; // 哨兵：尚未标定

    double scaleUnitsPerPixel = 1.0;
    QString units             = QString::fromLatin1(kPixelUnits);

    bool isCalibrated() const { return units != QLatin1String(kPixelUnits); }
};

// 一条已完成的测量。points 为图像坐标，长度永远从 points 重新推导
struct Measurement {
    MeasureKind kind = MeasureKind::Line;
    QVector<QPointF> points;
    double lengthValue = 0.0;
    QString units;
    QString displayLabel;
    QDateTime timestamp;

    double pixelLength() const;
};

// 分级精度：px 一位小数；其它单位 >=100 一位、>=10 两位、否则三位
QString formatLength(double value, const QString& units);

// 用当前标定生成一条新测量（时间戳取当前时刻）
Measurement makeMeasurement(
    MeasureKind kind, const QVector<QPointF>& points, const Calibration& cal,
    const QDateTime& timestamp = QDateTime::currentDateTime());

// 用当前标定重算单条/全部测量的 lengthValue、units、displayLabel
void recompute(Measurement& m, const Calibration& cal);
void recomputeAll(QVector<Measurement>& history, const Calibration& cal);

} // namespace measure
