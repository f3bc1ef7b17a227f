#pragma once

#include <unistd.h>
#include <atomic>
#include <cstdlib>
#include <string>
#include <string_view>
#include <charconv>
#include <system_error>
#include <mutex>

namespace compact {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Extremely lightweight buffer-based writer to replace std::format/std::cout
class Writer {
public:
    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    static void raw(int fd, const char* data, size_t size) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(fd, std::string_view(data, size));
    }

private:
    static void write_all(int fd, std::string_view s) {
        while (!s.empty()) {
            auto n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

// Leveled line logger on top of Writer. Lines go to stderr as
// "[rangefetch] <level> <message>\n".
class Log {
public:
    static void set_level(Level level) { level_ref().store(level, std::memory_order_relaxed); }
    static Level level() { return level_ref().load(std::memory_order_relaxed); }
    static bool enabled(Level level) { return level >= Log::level(); }

    static void debug(std::string_view msg) { emit(Level::Debug, "debug", msg); }
    static void info(std::string_view msg) { emit(Level::Info, "info", msg); }
    static void warn(std::string_view msg) { emit(Level::Warn, "warn", msg); }
    static void error(std::string_view msg) { emit(Level::Error, "error", msg); }

    static Level parse_level(std::string_view name, Level fallback) {
        if (name == "debug") return Level::Debug;
        if (name == "info") return Level::Info;
        if (name == "warn") return Level::Warn;
        if (name == "error") return Level::Error;
        if (name == "off") return Level::Off;
        return fallback;
    }

private:
    static void emit(Level level, std::string_view tag, std::string_view msg) {
        if (!enabled(level)) return;
        std::string line;
        line.reserve(msg.size() + 24);
        line += "[rangefetch] ";
        line += tag;
        line += ' ';
        line += msg;
        line += '\n';
        Writer::error(line);
    }

    static std::atomic<Level>& level_ref() {
        static std::atomic<Level> lvl{initial_level()};
        return lvl;
    }

    static Level initial_level() {
        const char* env = std::getenv("RANGEFETCH_LOG");
        if (!env) return Level::Warn;
        return parse_level(env, Level::Warn);
    }
};

template<typename T>
std::string num(T val) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    if (ec != std::errc()) return "?";
    return std::string(buf, ptr);
}

} // namespace compact
