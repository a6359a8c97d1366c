#pragma once
#include <QScopedPointer>
#include <QSettings>
#include <QString>
#include <memory>

namespace controller {

class AppSettings final {
public:
    // ---- lifecycle ----
    static void initOrgApp(const QString& org, const QString& app) noexcept;
    static AppSettings& instance() noexcept;
    static void useIniFile(const QString& iniFilePath);

    // ---- 一次性同步 ----
    void sync() noexcept;

    // ====== 这里用宏自动生成 getter/setter（不使用模板） ======
#define APP_SETTING_RW_STR(Name, Key, DefStr)                                        \
    QString Name() const noexcept { return settings_->value(Key, QString(DefStr)).toString(); } \
    AppSettings& set##Name(const QString& v) { settings_->setValue(Key, v); return *this; }

#define APP_SETTING_RW_INT(Name, Key, DefVal)                                        \
    int Name() const noexcept { return settings_->value(Key, int(DefVal)).toInt(); }  \
    AppSettings& set##Name(int v) { settings_->setValue(Key, v); return *this; }

#define APP_SETTING_RW_DOUBLE(Name, Key, DefVal)                                     \
    double Name() const noexcept { return settings_->value(Key, double(DefVal)).toDouble(); } \
    AppSettings& set##Name(double v) { settings_->setValue(Key, v); return *this; }

#define APP_SETTING_RW_BOOL(Name, Key, DefVal)                                       \
    bool Name() const noexcept { return settings_->value(Key, bool(DefVal)).toBool(); } \
    AppSettings& set##Name(bool v) { settings_->setValue(Key, v); return *this; }

    // ---- 用一行声明各配置 ----
    APP_SETTING_RW_STR   (lastImageDir,     Keys::kLastImageDir,     ""                     )
    APP_SETTING_RW_STR   (lastExportDir,    Keys::kLastExportDir,    ""                     )
    APP_SETTING_RW_STR   (defaultUnits,     Keys::kDefaultUnits,     Def::kDefaultUnits     )
    APP_SETTING_RW_DOUBLE(defaultLength,    Keys::kDefaultLength,    Def::kDefaultLength    )
    APP_SETTING_RW_BOOL  (guideHorizontal,  Keys::kGuideHorizontal,  Def::kGuideOn          )
    APP_SETTING_RW_BOOL  (guideVertical,    Keys::kGuideVertical,    Def::kGuideOn          )
    APP_SETTING_RW_BOOL  (guideDiagonal45,  Keys::kGuideDiagonal45,  Def::kGuideOn          )
    APP_SETTING_RW_BOOL  (guideDiagonal135, Keys::kGuideDiagonal135, Def::kGuideOn          )
    APP_SETTING_RW_BOOL  (autoPaste,        Keys::kAutoPaste,        Def::kAutoPaste        )
    APP_SETTING_RW_INT   (jpegQuality,      Keys::kJpegQuality,      Def::kJpegQuality      )
    APP_SETTING_RW_STR   (logLevel,         Keys::kLogLevel,         Def::kLogLevel         )
    APP_SETTING_RW_STR   (logFile,          Keys::kLogFile,          ""                     )

#undef APP_SETTING_RW_STR
#undef APP_SETTING_RW_INT
#undef APP_SETTING_RW_DOUBLE
#undef APP_SETTING_RW_BOOL

    // 禁止拷贝移动
    AppSettings(const AppSettings&) = delete;
    AppSettings& operator=(const AppSettings&) = delete;
    AppSettings(AppSettings&&) = delete;
    AppSettings& operator=(AppSettings&&) = delete;

private:
    AppSettings(); // 仅 instance() 可用

    struct Keys {
        static constexpr const char* kLastImageDir     = "io/lastImageDir";
        static constexpr const char* kLastExportDir    = "io/lastExportDir";
        static constexpr const char* kDefaultUnits     = "calibration/defaultUnits";
        static constexpr const char* kDefaultLength    = "calibration/defaultLength";
        static constexpr const char* kGuideHorizontal  = "guides/horizontal";
        static constexpr const char* kGuideVertical    = "guides/vertical";
        static constexpr const char* kGuideDiagonal45  = "guides/diagonal45";
        static constexpr const char* kGuideDiagonal135 = "guides/diagonal135";
        static constexpr const char* kAutoPaste        = "startup/autoPaste";
        static constexpr const char* kJpegQuality      = "export/jpegQuality";
        static constexpr const char* kLogLevel         = "log/level";
        static constexpr const char* kLogFile          = "log/file";
    };
    struct Def {
        static constexpr const char* kDefaultUnits  = "mm";
        static constexpr double kDefaultLength      = 100.0;
        static constexpr bool kGuideOn              = true;
        static constexpr bool kAutoPaste            = true;
        static constexpr int  kJpegQuality          = 95;
        static constexpr const char* kLogLevel      = "info";
    };

    std::unique_ptr<QSettings> settings_;
    static QScopedPointer<QSettings> s_iniOverride_;
};

} // namespace controller
