#include "hexnav/core/Log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <system_error>
#include <vector>

namespace hexnav::logsys {

namespace {

constexpr const char* kLoggerName = "hexnav";
constexpr const char* kPattern    = "[%Y-%m-%d %H:%M:%S.%e][%l] %v";
constexpr std::size_t kMaxFileBytes = 1u << 20; // 1 MiB
constexpr std::size_t kMaxFiles     = 4;

std::mutex g_mx;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> MakeConsoleLogger()
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern(kPattern);
    return logger;
}

} // namespace

void Init(const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!options.file.empty())
    {
        std::error_code ec;
        if (options.file.has_parent_path())
            std::filesystem::create_directories(options.file.parent_path(), ec);

        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file.string(), kMaxFileBytes, kMaxFiles));
        }
        catch (const spdlog::spdlog_ex& e)
        {
            // Keep logging to the console; a bad log path is not fatal.
            if (sinks.empty())
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            auto fallback = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            fallback->warn("Log file '{}' unavailable: {}", options.file.string(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(options.level);
    logger->flush_on(spdlog::level::warn);

    {
        std::lock_guard<std::mutex> lk(g_mx);
        g_logger = logger;
    }
    spdlog::set_default_logger(logger);
    logger->debug("Logging started");
}

void Shutdown()
{
    std::lock_guard<std::mutex> lk(g_mx);
    if (g_logger)
    {
        g_logger->flush();
        g_logger.reset();
    }
}

std::shared_ptr<spdlog::logger> Get()
{
    std::lock_guard<std::mutex> lk(g_mx);
    if (!g_logger)
        g_logger = MakeConsoleLogger();
    return g_logger;
}

spdlog::level::level_enum ParseLevel(std::string_view name) noexcept
{
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace hexnav::logsys
