#include "qt/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

Q_LOGGING_CATEGORY(sortidEntropyLog, "sortid.entropy")

namespace sortid::qt {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }
}

} // namespace

bool install_file_logging(const QString& path) {
    if (path.isEmpty()) {
        return false;
    }

    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }

        QDir dir(QFileInfo(path).absolutePath());
        dir.mkpath(QStringLiteral("."));

        s.file.setFileName(path);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return false;
        }
    }

    const auto previous = qInstallMessageHandler(message_handler);
    if (!s.installed) {
        s.previous = previous;
        s.installed = true;
    }
    return true;
}

void uninstall_file_logging() {
    auto& s = state();
    if (!s.installed) {
        return;
    }
    qInstallMessageHandler(s.previous);
    QMutexLocker lock(&s.mu);
    s.file.close();
    s.previous = nullptr;
    s.installed = false;
}

QString log_file_path_from_env() {
    return qEnvironmentVariable("SORTID_LOG_FILE");
}

} // namespace sortid::qt
