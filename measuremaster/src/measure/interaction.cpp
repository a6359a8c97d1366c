#include "measure/interaction.hpp"

namespace measure {

QString toolModeName(ToolMode mode) {
    switch (mode) {
    case ToolMode::Idle: return QStringLiteral("idle");
    case ToolMode::Calibrate: return QStringLiteral("calibrate");
    case ToolMode::Line: return QStringLiteral("line");
    case ToolMode::Polyline: return QStringLiteral("polyline");
    }
    return QStringLiteral("idle");
}

int maxPendingPoints(ToolMode mode) {
    switch (mode) {
    case ToolMode::Idle: return 0;
    case ToolMode::Calibrate:
    case ToolMode::Line: return 2;
    case ToolMode::Polyline: return -1;
    }
    return 0;
}

} // namespace measure
