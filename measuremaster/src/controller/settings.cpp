#include "settings.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QScopedPointer>

namespace controller {
QScopedPointer<QSettings> AppSettings::s_iniOverride_;

void AppSettings::initOrgApp(const QString& org, const QString& app) noexcept {
    // Best called in main() before creating QApplication/QGuiApplication.
    QCoreApplication::setOrganizationName(org);
    QCoreApplication::setApplicationName(app);
}

void AppSettings::useIniFile(const QString& iniFilePath) {
    // Must run before the first instance() call.
    QFileInfo fi(iniFilePath);
    QDir().mkpath(fi.dir().absolutePath());
    s_iniOverride_.reset(new QSettings(iniFilePath, QSettings::IniFormat));
}

AppSettings& AppSettings::instance() noexcept {
    static AppSettings inst;
    return inst;
}

void AppSettings::sync() noexcept { settings_->sync(); }

AppSettings::AppSettings()
    // If ini override exists, duplicate its format/path; else default org/app.
    : settings_(
          s_iniOverride_
              ? std::make_unique<QSettings>(s_iniOverride_->fileName(), s_iniOverride_->format())
              : std::make_unique<QSettings>()) {
    settings_->setFallbacksEnabled(false);
}

} // namespace controller
