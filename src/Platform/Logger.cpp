#include <ChtVision/Platform/Logger.h>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Cht::Vision::Platform {

namespace {

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::warn;
}

LogLevel FromSpdlog(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return LogLevel::Trace;
        case spdlog::level::debug: return LogLevel::Debug;
        case spdlog::level::info:  return LogLevel::Info;
        case spdlog::level::warn:  return LogLevel::Warn;
        case spdlog::level::err:
        case spdlog::level::critical: return LogLevel::Error;
        default: return LogLevel::Off;
    }
}

std::mutex g_loggerMutex;

} // anonymous namespace

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_loggerMutex);

    // Reuse a logger registered by the application under the same name
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::warn);
    }
    return logger;
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(ToSpdlog(level));
}

LogLevel GetLogLevel() {
    return FromSpdlog(GetLogger()->level());
}

} // namespace Cht::Vision::Platform
