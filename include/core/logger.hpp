/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <source_location>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace csn::core {

    // Console sink: "[hh:mm:ss.mmm] [level] file:line  module  message"
    template <typename Mutex>
    class console_color_sink : public spdlog::sinks::base_sink<Mutex> {
    public:
        console_color_sink() {
            colors_[spdlog::level::trace] = "\033[37m";
            colors_[spdlog::level::debug] = "\033[36m";
            colors_[spdlog::level::info] = "\033[32m";
            colors_[spdlog::level::warn] = "\033[33m";
            colors_[spdlog::level::err] = "\033[31m";
            colors_[spdlog::level::critical] = "\033[1;31m";
            colors_[spdlog::level::off] = "\033[0m";
        }

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            const auto time_t_val = std::chrono::system_clock::to_time_t(msg.time);
            const auto tm = *std::localtime(&time_t_val);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    msg.time.time_since_epoch())
                                    .count() %
                                1000;

            std::string_view full_path(msg.source.filename ? msg.source.filename : "");
            const auto last_slash = full_path.find_last_of("/\\");
            const std::string_view filename = (last_slash != std::string_view::npos)
                                                  ? full_path.substr(last_slash + 1)
                                                  : full_path;

            const std::string_view payload(msg.payload.data(), msg.payload.size());
            std::cout << std::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}[{}]{} {}:{}  {}\n",
                                     tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis),
                                     colors_[static_cast<size_t>(msg.level)], level_label(msg.level), kReset,
                                     filename, msg.source.line, payload)
                      << std::flush;
        }

        void flush_() override {
            std::cout << std::flush;
        }

    private:
        static constexpr std::string_view kReset = "\033[0m";

        static std::string_view level_label(spdlog::level::level_enum level) {
            switch (level) {
            case spdlog::level::trace: return "trace";
            case spdlog::level::debug: return "debug";
            case spdlog::level::warn: return "warn";
            case spdlog::level::err: return "error";
            case spdlog::level::critical: return "critical";
            default: return "info";
            }
        }

        std::array<std::string, 7> colors_;
    };

    using console_color_sink_mt = console_color_sink<std::mutex>;

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    // Subsystem a log call belongs to, detected from its source path
    enum class LogModule : uint8_t {
        Core = 0,
        Topology = 1,
        Padding = 2,
        Convolution = 3,
        Config = 4,
        Test = 5,
        Unknown = 6,
        Count = 7
    };

    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        /**
         * @brief Install the console sink and, if `log_file` is set, a file sink
         *
         * The file sink always records everything from Trace up; `console_level`
         * filters both, per-module levels filter on top of it.
         */
        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "") {
            std::lock_guard lock(mutex_);

            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<console_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(console_level));
            sinks.push_back(console_sink);

            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
                sinks.push_back(file_sink);
            }

            logger_ = std::make_shared<spdlog::logger>("csn", sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            spdlog::set_default_logger(logger_);

            global_level_ = static_cast<uint8_t>(console_level);
            for (auto& level : module_level_) {
                level = static_cast<uint8_t>(LogLevel::Trace);
            }
        }

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            if (!logger_)
                return;

            const auto module = detect_module(loc.file_name());
            if (static_cast<uint8_t>(level) < global_level_ ||
                static_cast<uint8_t>(level) < module_level_[static_cast<size_t>(module)]) {
                return;
            }

            auto msg = std::format("{:<11} ", module_name(module));
            msg += std::format(fmt, std::forward<Args>(args)...);

            logger_->log(
                spdlog::source_loc{loc.file_name(),
                                   static_cast<int>(loc.line()),
                                   loc.function_name()},
                to_spdlog_level(level),
                msg);
        }

        // LogLevel::Off silences a module entirely
        void set_module_level(LogModule module, LogLevel level) {
            module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
        }

        void set_level(LogLevel level) {
            global_level_ = static_cast<uint8_t>(level);
        }

        void flush() {
            if (logger_)
                logger_->flush();
        }

        static constexpr std::string_view module_name(LogModule module) {
            switch (module) {
            case LogModule::Core: return "core";
            case LogModule::Topology: return "topology";
            case LogModule::Padding: return "padding";
            case LogModule::Convolution: return "convolution";
            case LogModule::Config: return "config";
            case LogModule::Test: return "test";
            default: return "unknown";
            }
        }

    private:
        Logger() = default;

        // Order matters: "cube_halo_padder" must not fall through to "layers"
        static LogModule detect_module(std::string_view path) {
            if (path.find("/tests/") != std::string_view::npos)
                return LogModule::Test;
            if (path.find("topology") != std::string_view::npos)
                return LogModule::Topology;
            if (path.find("padder") != std::string_view::npos)
                return LogModule::Padding;
            if (path.find("conv") != std::string_view::npos)
                return LogModule::Convolution;
            if (path.find("config") != std::string_view::npos)
                return LogModule::Config;
            if (path.find("core") != std::string_view::npos ||
                path.find("layers") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        static constexpr spdlog::level::level_enum to_spdlog_level(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mutex_;
        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Logs the lifetime of a scope at `level` when it ends
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Debug,
                             std::source_location loc = std::source_location::current())
            : start_(std::chrono::steady_clock::now()),
              name_(std::move(name)),
              level_(level),
              loc_(loc) {}

        ~ScopedTimer() {
            const auto elapsed = std::chrono::steady_clock::now() - start_;
            Logger::get().log_internal(level_, loc_, "{} took {:.3f}ms", name_,
                                       std::chrono::duration<double, std::milli>(elapsed).count());
        }

    private:
        std::chrono::steady_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
    };

} // namespace csn::core

#define CSN_LOG_CONCAT_INNER(a, b) a##b
#define CSN_LOG_CONCAT(a, b)       CSN_LOG_CONCAT_INNER(a, b)

#define LOG_TRACE(...) \
    ::csn::core::Logger::get().log_internal(::csn::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::csn::core::Logger::get().log_internal(::csn::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::csn::core::Logger::get().log_internal(::csn::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::csn::core::Logger::get().log_internal(::csn::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::csn::core::Logger::get().log_internal(::csn::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::csn::core::Logger::get().log_internal(::csn::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define LOG_TIMER_TRACE(name) ::csn::core::ScopedTimer CSN_LOG_CONCAT(csn_timer_, __LINE__)(name, ::csn::core::LogLevel::Trace)
