#pragma once
#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace hexnav::logsys {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
    // Empty = no file sink. Rotates at 1 MiB, keeps 4 files.
    std::filesystem::path file;
};

// Builds the "hexnav" logger and makes it the spdlog default. Safe to call again
// (e.g. after settings are reloaded); the previous logger is replaced.
void Init(const LogOptions& options);
void Shutdown();

// Never null: falls back to a console-only logger when Init() was not called.
std::shared_ptr<spdlog::logger> Get();

// "trace", "debug", "info", "warn", "error", "off". Unknown names map to info.
spdlog::level::level_enum ParseLevel(std::string_view name) noexcept;

} // namespace hexnav::logsys

#ifndef HEXNAV_LOG_TRACE
  #define HEXNAV_LOG_TRACE(...) ::hexnav::logsys::Get()->trace(__VA_ARGS__)
#endif
#ifndef HEXNAV_LOG_DEBUG
  #define HEXNAV_LOG_DEBUG(...) ::hexnav::logsys::Get()->debug(__VA_ARGS__)
#endif
#ifndef HEXNAV_LOG_INFO
  #define HEXNAV_LOG_INFO(...)  ::hexnav::logsys::Get()->info(__VA_ARGS__)
#endif
#ifndef HEXNAV_LOG_WARN
  #define HEXNAV_LOG_WARN(...)  ::hexnav::logsys::Get()->warn(__VA_ARGS__)
#endif
#ifndef HEXNAV_LOG_ERROR
  #define HEXNAV_LOG_ERROR(...) ::hexnav::logsys::Get()->error(__VA_ARGS__)
#endif
