#include "core/log.hpp"
#include <mutex>
#include <iostream>
#include <atomic>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace wv::log {

static SinkFn g_sink;
static std::mutex g_mutex;
static std::atomic<bool> g_json{false};
static std::atomic<Level> g_level{Level::Info};

const char* level_name(Level lvl) noexcept {
    switch(lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
    }
    return "unknown";
}

static spdlog::level::level_enum to_spdlog(Level lvl) {
    switch(lvl) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void set_sink(SinkFn sink) noexcept {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void set_level(Level lvl) noexcept {
    g_level.store(lvl, std::memory_order_relaxed);
    // spdlog filters on its own level too; keep both in step so the facade decides.
    spdlog::set_level(to_spdlog(lvl));
}

Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

void set_json_mode(bool enabled) noexcept { g_json.store(enabled, std::memory_order_relaxed); }
bool json_mode() noexcept { return g_json.load(std::memory_order_relaxed); }

static void emit_json(Level lvl, const std::string& msg) {
    // {"ts":"ISO8601","level":"info","msg":"..."}
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream line;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    line << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
         << '.' << std::setw(3) << std::setfill('0') << ms.count()
         << "\",\"level\":\"" << level_name(lvl) << "\",\"msg\":\"";
    for(char c : msg) {
        switch(c) {
            case '"': line << "\\\""; break;
            case '\\': line << "\\\\"; break;
            case '\n': line << "\\n"; break;
            case '\r': line << "\\r"; break;
            case '\t': line << "\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20) {
                    line << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                         << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    line << c;
                }
                break;
        }
    }
    line << "\"}";
    std::clog << line.str() << '\n';
}

static void default_emit(Level lvl, const std::string& msg) {
    if(json_mode()) {
        emit_json(lvl, msg);
        return;
    }
    switch(lvl){
        case Level::Trace: spdlog::trace(msg); break;
        case Level::Debug: spdlog::debug(msg); break;
        case Level::Info: spdlog::info(msg); break;
        case Level::Warn: spdlog::warn(msg); break;
        case Level::Error: spdlog::error(msg); break;
        case Level::Critical: spdlog::critical(msg); break;
    }
}

void write(Level lvl, const std::string& msg) noexcept {
    if(static_cast<int>(lvl) < static_cast<int>(level())) return;
    std::scoped_lock lock(g_mutex);
    try {
        if(g_sink) { g_sink(lvl, msg); return; }
        default_emit(lvl, msg);
    } catch(const std::exception& e) {
        std::cerr << "log sink failed: " << e.what() << '\n';
    }
}

void trace(const std::string& msg) noexcept { write(Level::Trace, msg); }
void debug(const std::string& msg) noexcept { write(Level::Debug, msg); }
void info(const std::string& msg) noexcept { write(Level::Info, msg); }
void warn(const std::string& msg) noexcept { write(Level::Warn, msg); }
void error(const std::string& msg) noexcept { write(Level::Error, msg); }
void critical(const std::string& msg) noexcept { write(Level::Critical, msg); }

} // namespace wv::log
