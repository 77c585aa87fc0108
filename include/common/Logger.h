#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace candlebot {

class Logger {
public:
    // STDERR keeps stdout free for machine-readable output (--json)
    enum class ConsoleStream { STDOUT, STDERR };

    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info",
                    ConsoleStream console = ConsoleStream::STDOUT);
    bool isInitialized() const { return initialized_; }
    ConsoleStream consoleStream() const { return console_; }
    std::shared_ptr<spdlog::logger> mainLogger() const { return main_logger_; }

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

    // One CSV line per fill: time,market,side,price,amount,fee_rate
    void logFill(long long time_ms, const std::string& market, const std::string& side,
                 double price, double amount, double fee_rate);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    ConsoleStream console_ = ConsoleStream::STDOUT;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) candlebot::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) candlebot::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) candlebot::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) candlebot::Logger::getInstance().error(__VA_ARGS__)

} // namespace candlebot
