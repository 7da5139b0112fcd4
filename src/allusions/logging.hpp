#pragma once

#include <iostream>
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace allusions {

enum class LogLevel { Debug, Info, Warn, Error };

inline std::ostream& operator<<(std::ostream& out, LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return out << "Debug";
        case LogLevel::Info: return out << "Info";
        case LogLevel::Warn: return out << "Warn";
        case LogLevel::Error: return out << "Error";
    }
    return out << "Unknown";
}

class Logger {
    struct Color {
        static constexpr const char* Red = "\033[31m";
        static constexpr const char* Green = "\033[32m";
        static constexpr const char* Yellow = "\033[33m";
        static constexpr const char* Cyan = "\033[36m";
        static constexpr const char* Reset = "\033[0m";
    };

    inline static LogLevel threshold = LogLevel::Info;

    // Function that returns the string with time in a format like this: 2024-04-25T18:21:00.010 (with parts of seconds)
    // https://gist.github.com/bschlinker/844a88c09dcf7a61f6a8df1e52af7730
    static std::string getCurrentTime() {
        const auto now = std::chrono::system_clock::now();
        const auto nowAsTimeT = std::chrono::system_clock::to_time_t(now);
        const auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;
        std::tm local_time{};
        localtime_r(&nowAsTimeT, &local_time);
        std::stringstream nowSs;
        nowSs << std::put_time(&local_time, "%FT%T")
              << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
        return nowSs.str();
    }

    // Maybe and Result arguments print through their operator<< from repr.hpp
    template<typename... Args>
    static std::string concatenateArgs(Args&&... args) {
        std::ostringstream oss;
        (oss << ... << args);
        return oss.str();
    }

    template<typename... Args>
    static void _print(LogLevel level, const char* color, Args&&... args) {
        if (level < threshold) {
            return;
        }
        std::cerr << getCurrentTime() << " " << color << "[" << level << "]"
                  << Color::Reset << " " << concatenateArgs(std::forward<Args>(args)...) << std::endl;
    }

public:
    static void set_level(LogLevel level) { threshold = level; }
    static LogLevel level() { return threshold; }

    template<typename... Args>
    static void debug(Args&&... args) {
        _print(LogLevel::Debug, Color::Cyan, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(Args&&... args) {
        _print(LogLevel::Info, Color::Green, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(Args&&... args) {
        _print(LogLevel::Warn, Color::Yellow, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(Args&&... args) {
        _print(LogLevel::Error, Color::Red, std::forward<Args>(args)...);
    }
};

} // namespace allusions
