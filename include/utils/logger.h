#pragma once

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace catalog {
namespace utils {

class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERR, CRITICAL };

    static void init(const std::string& log_file = "catalog_server.log", Level level = Level::INFO);
    static void shutdown();
    static bool isInitialized() { return logger_ != nullptr; }
    // Changes the threshold of the running logger; ignored before init()
    static void setLevel(Level level);
    // Returns INFO on unknown input
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    template<typename FormatString, typename... Args>
    static void write(Level level, FormatString&& fmt, Args&&... args);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace catalog

#include "utils/logger_impl.h"

// Logging macros
#define CATALOG_TRACE(...) ::catalog::utils::Logger::trace(__VA_ARGS__)
#define CATALOG_DEBUG(...) ::catalog::utils::Logger::debug(__VA_ARGS__)
#define CATALOG_INFO(...) ::catalog::utils::Logger::info(__VA_ARGS__)
#define CATALOG_WARN(...) ::catalog::utils::Logger::warn(__VA_ARGS__)
#define CATALOG_ERROR(...) ::catalog::utils::Logger::error(__VA_ARGS__)
#define CATALOG_CRITICAL(...) ::catalog::utils::Logger::critical(__VA_ARGS__)
