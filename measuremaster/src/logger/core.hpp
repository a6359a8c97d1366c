#pragma once
#include <QDateTime>
#include <QFile>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace logger {

class Logger : public QObject {
    Q_OBJECT
public:
    enum class Level { Debug = 0, Info, Warn, Error };

    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // "debug" / "info" / "warn" / "error"，无法识别时返回 Info
    static Level levelFromString(const QString& s) {
        const QString k = s.trimmed().toLower();
        if (k == QLatin1String("debug"))
            return Level::Debug;
        if (k == QLatin1String("warn") || k == QLatin1String("warning"))
            return Level::Warn;
        if (k == QLatin1String("error"))
            return Level::Error;
        return Level::Info;
    }

    void setMinLevel(Level lvl) {
        QMutexLocker lock(&mutex_);
        minLevel_ = lvl;
    }
    Level minLevel() const {
        QMutexLocker lock(&mutex_);
        return minLevel_;
    }

    // 额外写入日志文件（追加）；空路径关闭文件输出
    bool setLogFile(const QString& path) {
        QMutexLocker lock(&mutex_);
        file_.reset();
        if (path.isEmpty())
            return true;
        auto f = std::make_unique<QFile>(path);
        if (!f->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
            return false;
        file_ = std::move(f);
        return true;
    }

    void log(Level lvl, const QString& msg) { writeLine(lvl, msg); }
    inline void info(const QString& s) { log(Level::Info, s); }
    inline void warn(const QString& s) { log(Level::Warn, s); }
    inline void error(const QString& s) { log(Level::Error, s); }
    inline void debug(const QString& s) { log(Level::Debug, s); }

    // 安装 Qt 全局消息处理器
    static void installQtHandler() {
        qInstallMessageHandler([](QtMsgType type, const QMessageLogContext&, const QString& msg) {
            auto& L   = Logger::instance();
            Level lvl = Level::Info;
            switch (type) {
            case QtDebugMsg: lvl = Level::Debug; break;
            case QtWarningMsg: lvl = Level::Warn; break;
            case QtCriticalMsg: lvl = Level::Error; break;
            case QtFatalMsg: lvl = Level::Error; break;
            default: lvl = Level::Info; break;
            }
            L.writeLine(lvl, msg);
            if (type == QtFatalMsg)
                std::abort();
        });
    }

signals:
    // UI 日志面板订阅此信号（跨线程请用 QueuedConnection）
    void lineLogged(const QString& line);

private:
    explicit Logger(QObject* parent = nullptr)
        : QObject(parent) {}

    void writeLine(Level lvl, const QString& msg) {
        static const QHash<int, QString> tag{
            {int(Level::Info),   "[INFO]"},
            {int(Level::Warn),   "[WARN]"},
            {int(Level::Error), "[ERROR]"},
            {int(Level::Debug), "[DEBUG]"},
        };
        static const QHash<int, const char*> color{
            {int(Level::Info),  "\033[32m"}, // 绿色
            {int(Level::Warn),  "\033[33m"}, // 黄色
            {int(Level::Error), "\033[31m"}, // 红色
            {int(Level::Debug), "\033[36m"}, // 青色
        };
        static constexpr const char* reset = "\033[0m";

        const QString line = QString("%1 %2 %3")
                                 .arg(QDateTime::currentDateTime().toString("HH:mm:ss"))
                                 .arg(tag.value(int(lvl)))
                                 .arg(msg);
        {
            QMutexLocker lock(&mutex_);
            if (int(lvl) < int(minLevel_))
                return;
            if (file_) {
                file_->write(line.toUtf8());
                file_->write("\n");
                file_->flush();
            }
        }

        // 控制台彩色输出
        QByteArray utf8 = line.toUtf8();
        std::fprintf(stderr, "%s%s%s\n", color.value(int(lvl)), utf8.constData(), reset);
        std::fflush(stderr);

        emit lineLogged(line);
    }

    mutable QMutex mutex_;
    Level minLevel_ = Level::Info;
    std::unique_ptr<QFile> file_;
};

} // namespace logger

// 宏
#define LOGI(...) logger::Logger::instance().info(__VA_ARGS__)
#define LOGW(...) logger::Logger::instance().warn(__VA_ARGS__)
#define LOGE(...) logger::Logger::instance().error(__VA_ARGS__)
#define LOGD(...) logger::Logger::instance().debug(__VA_ARGS__)
