#include "Log.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace {

constexpr const char* LoggerName = "ep_assetmaker";
constexpr const char* LogPattern = "%Y-%m-%d %H:%M:%S.%e [%n] [thread %t] [%l] %v";

std::mutex s_mutex;
std::shared_ptr<spdlog::logger> s_logger;
QString s_logFile;

QString baseDirectory() {
    if (QCoreApplication::instance())
        return QCoreApplication::applicationDirPath();
    return QDir::currentPath();
}

std::shared_ptr<spdlog::logger> makeConsoleLogger(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LoggerName, sink);
    logger->set_level(level);
    logger->set_pattern(LogPattern);
    return logger;
}

} // namespace

namespace Log {

bool init(const LogSettings& settings) {
    std::lock_guard<std::mutex> lock(s_mutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (settings.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    QString dirPath = settings.directory;
    if (QFileInfo(dirPath).isRelative())
        dirPath = QDir(baseDirectory()).filePath(dirPath);

    QString fileName = QString("%1_%2.log")
        .arg(settings.prefix, QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss"));
    QString filePath = QDir(dirPath).filePath(fileName);

    bool fileOk = false;
    QString fileError;
    if (QDir().mkpath(dirPath)) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                filePath.toStdString(), true));
            fileOk = true;
        } catch (const spdlog::spdlog_ex& e) {
            fileError = QString::fromUtf8(e.what());
        }
    } else {
        fileError = QString("Cannot create log directory: %1").arg(dirPath);
    }

    if (sinks.empty())
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    s_logger = std::make_shared<spdlog::logger>(LoggerName, sinks.begin(), sinks.end());
    s_logger->set_level(settings.level);
    s_logger->set_pattern(LogPattern);
    s_logger->flush_on(spdlog::level::warn);
    s_logFile = fileOk ? filePath : QString();

    if (fileOk) {
        s_logger->info("Logging to {}", qUtf8Printable(filePath));
    } else {
        s_logger->warn("File logging disabled: {}", qUtf8Printable(fileError));
    }
    return fileOk;
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_logger)
        s_logger = makeConsoleLogger(spdlog::level::info);
    return s_logger;
}

QString currentLogFile() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_logFile;
}

spdlog::level::level_enum levelFromString(const QString& name) {
    const QString lowered = name.trimmed().toLower();
    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical" || lowered == "fatal") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace Log
