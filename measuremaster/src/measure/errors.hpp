#pragma once
#include <QString>

namespace measure {

// 所有可恢复错误都以值返回，失败时模型保持上一个有效状态
struct MeasureError {
    enum class Code {
        Success,
        ZeroDistance,    // 标定两点重合
        InvalidLength,   // 实际长度非正/非有限
        ClipboardEmpty,  // 剪贴板里没有可用图像
        DecodeFailure,   // 图像解码失败
        ExportIO,        // 写文件失败
        NothingToExport, // 没有可导出的内容
        NoImage          // 尚未加载图像
    };

    Code code = Code::Success;
    QString message;

    static MeasureError ok() { return {}; }
    static MeasureError make(Code c, const QString& msg) { return {c, msg}; }

    bool isSuccess() const noexcept { return code == Code::Success; }

    QString toString() const {
        switch (code) {
        case Code::Success: return QStringLiteral("Success");
        case Code::ZeroDistance: return QStringLiteral("Zero distance: ") + message;
        case Code::InvalidLength: return QStringLiteral("Invalid length: ") + message;
        case Code::ClipboardEmpty: return QStringLiteral("Clipboard empty: ") + message;
        case Code::DecodeFailure: return QStringLiteral("Decode failure: ") + message;
        case Code::ExportIO: return QStringLiteral("Export failed: ") + message;
        case Code::NothingToExport: return QStringLiteral("Nothing to export: ") + message;
        case Code::NoImage: return QStringLiteral("No image: ") + message;
        }
        return QStringLiteral("Unknown error");
    }
};

} // namespace measure

#include <QMetaType>
Q_DECLARE_METATYPE(measure::MeasureError)
