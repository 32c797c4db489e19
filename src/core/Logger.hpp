/**
 * @file Logger.hpp
 * @brief Process-wide spdlog logger for observer-core.
 *
 * Logger owns a single spdlog instance with a colored console sink and a
 * rotating file sink under the cache directory. The LOG_* macros attach the
 * call site to every record.
 *
 * @section Dependencies
 * - spdlog
 *
 * @section Patterns
 * - Wrapper: hides sink setup behind init()/get().
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace oc {

class Logger {
public:
    static void init(std::string_view appName = "observer-core",
                     bool debug = false);
    static void shutdown();

    // Switches between info and debug without rebuilding sinks
    static void setDebug(bool debug);

    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(oc::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(oc::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(oc::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(oc::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(oc::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(oc::Logger::get(), __VA_ARGS__)

} // namespace oc
