#include "parkspot/logging.hpp"

#include <QDateTime>
#include <QFile>
#include <QString>

#include <cstdio>
#include <memory>
#include <mutex>

namespace parkspot {
namespace logging {

namespace {

struct LogSink {
    std::mutex mutex;
    QtMsgType min_level = QtInfoMsg;
    std::unique_ptr<QFile> file;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

// QtMsgType is not ordered by severity (QtInfoMsg == 4)
int severity(QtMsgType t) {
    switch (t) {
        case QtDebugMsg:    return 0;
        case QtInfoMsg:     return 1;
        case QtWarningMsg:  return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg:    return 4;
    }
    return 1;
}

const char* levelName(QtMsgType t) {
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARNING";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "CRITICAL";
    }
    return "INFO";
}

void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (severity(type) < severity(s.min_level)) return;

    const QByteArray line = (QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss,zzz"))
                             + QStringLiteral(" - ") + QLatin1String(levelName(type))
                             + QStringLiteral(" - ") + msg + QLatin1Char('\n')).toUtf8();

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);
    if (s.file) {
        s.file->write(line);
        s.file->flush();
    }
}

} // namespace

bool parseLevel(const std::string& level, QtMsgType& out) {
    if (level == "DEBUG")   { out = QtDebugMsg;    return true; }
    if (level == "INFO")    { out = QtInfoMsg;     return true; }
    if (level == "WARNING") { out = QtWarningMsg;  return true; }
    if (level == "ERROR")   { out = QtCriticalMsg; return true; }
    return false;
}

void installDefault() {
    {
        std::lock_guard<std::mutex> lock(sink().mutex);
        sink().min_level = QtInfoMsg;
    }
    qInstallMessageHandler(messageHandler);
}

bool install(const std::string& level, const std::string& file_path, std::string* err) {
    QtMsgType min_level = QtInfoMsg;
    if (!parseLevel(level, min_level)) {
        if (err) *err = "unknown log level: " + level;
        return false;
    }

    std::unique_ptr<QFile> file;
    bool ok = true;
    if (!file_path.empty()) {
        file = std::make_unique<QFile>(QString::fromStdString(file_path));
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            if (err) *err = "cannot open log file " + file_path + ": " + file->errorString().toStdString();
            file.reset();
            ok = false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(sink().mutex);
        sink().min_level = min_level;
        sink().file = std::move(file);
    }
    qInstallMessageHandler(messageHandler);
    return ok;
}

void uninstall() {
    std::lock_guard<std::mutex> lock(sink().mutex);
    if (sink().file) sink().file->close();
    sink().file.reset();
    sink().min_level = QtInfoMsg;
}

} // namespace logging
} // namespace parkspot
