#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace oc {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

constexpr std::size_t kMaxLogBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}

} // namespace

void Logger::init(std::string_view appName, bool debug) {
    const std::string name(appName);
    try {
        spdlog::drop(name);

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ [%t] %v");

        auto logDir = file::cacheDir() / "logs";
        if (!file::ensureDir(logDir)) {
            throw spdlog::spdlog_ex("cannot create " + logDir.string());
        }

        auto logFile = logDir / (name + ".log");
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), kMaxLogBytes, kMaxLogFiles);
        rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");

        spdlog::sinks_init_list sinks{console, rotating};
        logger_ = std::make_shared<spdlog::logger>(name, sinks);
        logger_->set_level(levelFor(debug));
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        LOG_DEBUG("Logging to {}", logFile.string());
    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(name);
        logger_ = spdlog::stdout_color_mt(name);
        logger_->set_level(levelFor(debug));
        logger_->warn("File logging disabled: {}", ex.what());
    }
}

void Logger::setDebug(bool debug) {
    get()->set_level(levelFor(debug));
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace oc
