#pragma once

/**
 * @file logger.hxx
 * @brief Logger singleton and RPROF_LOG_* stream macros
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * The profiler core never logs: recording must not block on I/O. Tools and
 * examples built on top of it report through this logger.
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace rprof {

namespace logger_detail {
/// Seconds since the first call.
inline auto elapsed_seconds() noexcept -> double {
    using clock = std::chrono::steady_clock;
    static const auto start = clock::now();
    return std::chrono::duration<double>(clock::now() - start).count();
}

inline constexpr const char* RESET = "\033[0m";
inline constexpr const char* CYAN = "\033[36m";
inline constexpr const char* MAGENTA = "\033[35m";
}  // namespace logger_detail

/**
 * @brief Process-wide, thread-safe logger.
 *
 *  - Runtime minimum level, checked without locking.
 *  - Console output (warnings and errors on stderr) or a plain-text log file.
 *  - Optional ANSI colors and short thread-ID stamps.
 *  - Stream-style log_stream temporaries that emit on destruction.
 */
class Logger {
   public:
    /// Severities, least to most severe. Filtering is `level >= min_level`.
    enum class level : int { DEBUG = 0, INFO = 1, SUCCESS = 2, WARNING = 3, ERROR = 4 };

    /**
     * @brief Collects `operator<<` tokens and hands the line to the Logger
     *        when it goes out of scope.
     *
     * @code
     *   RPROF_LOG_INFO << "saved " << n << " ranges";
     * @endcode
     */
    class log_stream {
       public:
        log_stream(Logger& logger_obj, level lvl) : lg_(logger_obj), level_(lvl) {}

        log_stream(log_stream&& other) noexcept : lg_(other.lg_), level_(other.level_), buf_(std::move(other.buf_)) { other.moved_ = true; }
        log_stream(const log_stream&) = delete;
        auto operator=(const log_stream&) -> log_stream& = delete;
        auto operator=(log_stream&&) -> log_stream& = delete;

        template <typename T>
        auto operator<<(const T& val) -> log_stream& {
            buf_ << val;
            return *this;
        }

        ~log_stream() {
            if (moved_) {
                return;
            }
            std::string msg = buf_.str();
            if (!msg.empty()) {
                lg_.emit(msg, level_);
            }
        }

       private:
        Logger& lg_;
        level level_;
        std::ostringstream buf_;
        bool moved_ = false;
    };

    static auto get_instance() -> Logger& {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    auto operator=(const Logger&) -> Logger& = delete;
    ~Logger() = default;

    /**
     * @brief Configure the logger. Must run once before the first message.
     *
     * @param file_path    Log file to append to; empty means console output.
     * @param use_colors   ANSI colors on console output.
     * @param show_thread  Prefix lines with the last digits of the thread ID.
     * @param min_level    Messages below this level are discarded.
     *
     * @throws std::runtime_error if already initialized or the file cannot be opened.
     */
    void initialize(const std::string& file_path = "", bool use_colors = true, bool show_thread = true, level min_level = level::INFO) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            throw std::runtime_error("Logger already initialized!");
        }
        if (!file_path.empty()) {
            file_.open(file_path, std::ios::app);
            if (!file_.is_open()) {
                throw std::runtime_error("Failed to open log file: " + file_path);
            }
        }
        use_colors_ = use_colors;
        show_thread_ = show_thread;
        min_level_.store(min_level, std::memory_order_relaxed);
        initialized_ = true;
    }

    log_stream debug() { return {*this, level::DEBUG}; }
    log_stream info() { return {*this, level::INFO}; }
    log_stream success() { return {*this, level::SUCCESS}; }
    log_stream warning() { return {*this, level::WARNING}; }
    log_stream error() { return {*this, level::ERROR}; }

    friend class log_stream;

   private:
    Logger() = default;

    struct level_meta {
        const char* label;  // 7 chars wide
        const char* color;
        bool use_err;
    };

    static auto meta_of(level lvl) noexcept -> level_meta {
        switch (lvl) {
            case level::DEBUG:
                return {.label = " DEBUG ", .color = "\033[34m", .use_err = false};
            case level::INFO:
                return {.label = "  INFO ", .color = "\033[94m", .use_err = false};
            case level::SUCCESS:
                return {.label = "SUCCESS", .color = "\033[92m", .use_err = false};
            case level::WARNING:
                return {.label = "WARNING", .color = "\033[93m", .use_err = true};
            case level::ERROR:
                return {.label = " ERROR ", .color = "\033[91m", .use_err = true};
        }
        return {.label = "       ", .color = "\033[37m", .use_err = false};
    }

    static auto format_time(double elapsed) -> std::string {
        constexpr int MS_PER_SECOND = 1000;
        constexpr int MS_PER_MINUTE = 60000;
        constexpr int MS_PER_HOUR = 3600000;

        const int total_ms = static_cast<int>(elapsed * MS_PER_SECOND);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", total_ms / MS_PER_HOUR, (total_ms % MS_PER_HOUR) / MS_PER_MINUTE,
                      (total_ms % MS_PER_MINUTE) / MS_PER_SECOND, total_ms % MS_PER_SECOND);
        return buf;
    }

    static auto short_thread_id() -> std::string {
        std::ostringstream ostr;
        ostr << std::this_thread::get_id();
        std::string str = ostr.str();
        return str.size() > 4 ? str.substr(str.size() - 4) : str;
    }

    void emit(const std::string& message, level lvl) {
        if (lvl < min_level_.load(std::memory_order_relaxed)) {
            return;
        }
        const std::string time_tag = "[" + format_time(logger_detail::elapsed_seconds()) + "] ";
        const std::string thread_tag = show_thread_ ? "[T:" + short_thread_id() + "] " : "";

        std::lock_guard lock(mutex_);
        if (!initialized_) {
            throw std::runtime_error("Logger not initialized!");
        }
        const auto [label, color, use_err] = meta_of(lvl);
        const std::string level_tag = std::string("[") + label + "] ";
        if (file_.is_open()) {
            file_ << time_tag << thread_tag << level_tag << message << '\n';
            file_.flush();
            return;
        }
        std::ostream& ostr = use_err ? std::cerr : std::cout;
        if (use_colors_) {
            ostr << logger_detail::CYAN << time_tag << logger_detail::RESET << logger_detail::MAGENTA << thread_tag << logger_detail::RESET << color
                 << level_tag << logger_detail::RESET << message << '\n';
        } else {
            ostr << time_tag << thread_tag << level_tag << message << '\n';
        }
    }

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool use_colors_ = true;
    bool show_thread_ = true;
    std::atomic<level> min_level_{level::INFO};
    std::ofstream file_;
};

}  // namespace rprof

#define RPROF_LOG_DEBUG ::rprof::Logger::get_instance().debug()
#define RPROF_LOG_INFO ::rprof::Logger::get_instance().info()
#define RPROF_LOG_SUCCESS ::rprof::Logger::get_instance().success()
#define RPROF_LOG_WARN ::rprof::Logger::get_instance().warning()
#define RPROF_LOG_ERROR ::rprof::Logger::get_instance().error()
