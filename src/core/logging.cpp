#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

namespace tidesync {

Q_LOGGING_CATEGORY(tidesyncSyncLog, "tidesync.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(tidesyncSchedulerLog, "tidesync.scheduler", QtInfoMsg)
Q_LOGGING_CATEGORY(tidesyncRemoteLog, "tidesync.remote", QtInfoMsg)
Q_LOGGING_CATEGORY(tidesyncConflictLog, "tidesync.conflict", QtInfoMsg)
Q_LOGGING_CATEGORY(tidesyncStorageLog, "tidesync.storage", QtInfoMsg)

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;

char severity_letter(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

// Append-only log file, opened lazily on the first message. When it grows
// past kRotateAtBytes the current file becomes <name>.1.
class LogFile {
public:
    void append(const QByteArray& line) {
        QMutexLocker lock(&mutex_);
        if (!opened_) open();
        if (!file_.isOpen()) return;

        file_.write(line);
        file_.flush();
        if (file_.size() > kRotateAtBytes) rotate();
    }

private:
    void open() {
        opened_ = true;
        const QString path = default_log_file_path();
        if (path.isEmpty()) return;

        if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
            std::fprintf(stderr, "tidesync: cannot create log directory for %s\n", qPrintable(path));
            return;
        }
        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "tidesync: cannot open log file %s: %s\n", qPrintable(path),
                         qPrintable(file_.errorString()));
        }
    }

    void rotate() {
        const QString path = file_.fileName();
        const QString previous = path + QStringLiteral(".1");
        file_.close();
        if (QFile::exists(previous) && !QFile::remove(previous)) {
            std::fprintf(stderr, "tidesync: cannot remove %s\n", qPrintable(previous));
        }
        if (!QFile::rename(path, previous)) {
            std::fprintf(stderr, "tidesync: cannot rotate %s\n", qPrintable(path));
        }
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "tidesync: cannot reopen log file %s: %s\n", qPrintable(path),
                         qPrintable(file_.errorString()));
        }
    }

    QMutex mutex_;
    QFile file_;
    bool opened_ = false;
};

LogFile& log_file() {
    static LogFile file;
    return file;
}

void write_message(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    const QString line = QStringLiteral("%1 %2 %3 %4\n")
                             .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs))
                             .arg(QChar::fromLatin1(severity_letter(type)))
                             .arg(QLatin1String(context.category ? context.category : "default"))
                             .arg(message);
    log_file().append(line.toUtf8());

    if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg) {
        std::fputs(line.toLocal8Bit().constData(), stderr);
    }
}

} // namespace

void install_file_logging() {
    qInstallMessageHandler(write_message);
}

QString default_log_file_path() {
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) return {};
    return QDir(base).filePath(QStringLiteral("logs/tidesync.log"));
}

bool sync_debug_requested() {
    return qEnvironmentVariableIsSet("TIDESYNC_DEBUG_SYNC");
}

void enable_sync_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("tidesync.*.debug=true"));
}

} // namespace tidesync
