#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace regimegate {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // Kill switch trips and accounting invariant failures.
    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->critical(fmt, std::forward<Args>(args)...);
        }
    }

    // fills as CSV: symbol,side,price,quantity,fee,realized_pnl
    void logFill(const std::string& symbol, const std::string& side,
                 double price, double quantity, double fee, double realized_pnl);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) regimegate::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) regimegate::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) regimegate::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) regimegate::Logger::getInstance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) regimegate::Logger::getInstance().critical(__VA_ARGS__)

} // namespace regimegate
