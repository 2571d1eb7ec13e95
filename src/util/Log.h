#pragma once

#include <QString>
#include <spdlog/spdlog.h>
#include <memory>

struct LogSettings {
    QString directory = "logs";     // relative paths resolve against the executable directory
    QString prefix = "ep_assetmaker";
    spdlog::level::level_enum level = spdlog::level::debug;
    bool console = true;
};

namespace Log {

// Creates the shared logger with a console sink and a timestamped file sink.
// Returns false (and keeps a console-only logger) when the log file cannot be created.
bool init(const LogSettings& settings);

// Lazily falls back to a console-only logger when init() was never called.
std::shared_ptr<spdlog::logger> get();

QString currentLogFile();

spdlog::level::level_enum levelFromString(const QString& name);

} // namespace Log

#define EPA_LOG_TRACE(...)    ::Log::get()->trace(__VA_ARGS__)
#define EPA_LOG_DEBUG(...)    ::Log::get()->debug(__VA_ARGS__)
#define EPA_LOG_INFO(...)     ::Log::get()->info(__VA_ARGS__)
#define EPA_LOG_WARN(...)     ::Log::get()->warn(__VA_ARGS__)
#define EPA_LOG_ERROR(...)    ::Log::get()->error(__VA_ARGS__)
#define EPA_LOG_CRITICAL(...) ::Log::get()->critical(__VA_ARGS__)
