#pragma once
#include <string>
#include <functional>

namespace wv::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

// Replaces the default emitter. Pass nullptr to restore it.
void set_sink(SinkFn sink) noexcept;

void write(Level lvl, const std::string& msg) noexcept;

// Messages below this level are dropped before reaching any sink.
void set_level(Level lvl) noexcept;
Level level() noexcept;

// Thin wrapper over spdlog; JSON mode writes one object per line to std::clog instead.
void set_json_mode(bool enabled) noexcept;
bool json_mode() noexcept;

const char* level_name(Level lvl) noexcept;

void trace(const std::string& msg) noexcept;
void debug(const std::string& msg) noexcept;
void info(const std::string& msg) noexcept;
void warn(const std::string& msg) noexcept;
void error(const std::string& msg) noexcept;
void critical(const std::string& msg) noexcept;

} // namespace wv::log
