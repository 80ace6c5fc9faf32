#pragma once
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Process-wide logger. Until init() is called every call is a no-op, so library code and
// tests can log freely.
class Logger {
public:
    // Non-copyable singleton
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    // Access singleton instance
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Initialize logger; an empty file_path disables the file sink
    void init(bool use_stdout = true, bool use_stderr = false, const std::string& file_path = "",
              spdlog::level::level_enum lvl = spdlog::level::info);

    // Core logging API
    template <typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    void flush();

private:
    Logger()  = default;
    ~Logger() = default;

    // Transfer workers log from many threads at once
    std::shared_ptr<spdlog::logger> current() {
        std::scoped_lock lock(mutex_);
        return logger_;
    }

    std::mutex                      mutex_;
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum       level_ = spdlog::level::info;
};

inline void Logger::init(bool use_stdout, bool use_stderr, const std::string& file_path,
                         spdlog::level::level_enum lvl) {
    std::scoped_lock              lock(mutex_);
    std::vector<spdlog::sink_ptr> sinks;
    level_ = lvl;

    if (use_stdout) {
        auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        stdout_sink->set_pattern("[%T] [%^%l%$] %v");
        stdout_sink->set_level(spdlog::level::debug);
        sinks.push_back(stdout_sink);
    }

    if (use_stderr) {
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        stderr_sink->set_pattern("[%T] [%^%l%$] %v");
        stderr_sink->set_level(spdlog::level::warn);
        sinks.push_back(stderr_sink);
    }

    if (!file_path.empty()) {
        try {
            std::filesystem::path path(file_path);
            if (!path.parent_path().empty())
                std::filesystem::create_directories(path.parent_path());

            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
            file_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        } catch (const std::exception& e) {
            fprintf(stderr, "Logger: failed to create log file (%s): %s\n", file_path.c_str(),
                    e.what());
        }
    }

    if (sinks.empty()) {
        logger_.reset();
        return;
    }

    // Build and configure async logger
    spdlog::init_thread_pool(8192, 1);
    logger_ = std::make_shared<spdlog::async_logger>("netspeed", sinks.begin(), sinks.end(),
                                                     spdlog::thread_pool(),
                                                     spdlog::async_overflow_policy::block);
    logger_->set_level(level_);
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::flush_every(std::chrono::seconds(3));
}

inline void Logger::flush() {
    std::scoped_lock lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
}

// Clean namespace for easy logging
namespace Log {
template <typename... Args>
inline void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().error(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().debug(fmt, std::forward<Args>(args)...);
}
}  // namespace Log
