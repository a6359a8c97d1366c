#include "measure/measurement.hpp"
#include "measure/geometry.hpp"

namespace measure {

QString kindName(MeasureKind kind) {
    switch (kind) {
    case MeasureKind::Line: return QStringLiteral("line");
    case MeasureKind::Polyline: return QStringLiteral("polyline");
    }
    return QStringLiteral("line");
}

double Measurement::pixelLength() const { return pathLength(points); }

QString formatLength(double value, const QString& units) {
    if (units == QLatin1String(Calibration::kPixelUnits))
        return QStringLiteral("%1 px").arg(value, 0, 'f', 1);

    int decimals = 3;
    if (value >= 100.0)
        decimals = 1;
    else if (value >= 10.0)
        decimals = 2;
    return QStringLiteral("%1 %2").arg(value, 0, 'f', decimals).arg(units);
}

Measurement makeMeasurement(
    MeasureKind kind, const QVector<QPointF>& points, const Calibration& cal,
    const QDateTime& timestamp) {
    Measurement m;
    m.kind      = kind;
    m.points    = points;
    m.timestamp = timestamp;
    recompute(m, cal);
    return m;
}

void recompute(Measurement& m, const Calibration& cal) {
    // Line 是两点折线的特例，统一走 pathLength
    m.lengthValue  = m.pixelLength() * cal.scaleUnitsPerPixel;
    m.units        = cal.units;
    m.displayLabel = formatLength(m.lengthValue, m.units);
}

void recomputeAll(QVector<Measurement>& history, const Calibration& cal) {
    for (auto& m : history)
        recompute(m, cal);
}

} // namespace measure
