#include "logger/Logger.hpp"
#include <memory>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

//---------------------------------------------------------------------------
namespace logger {
//---------------------------------------------------------------------------
void setup_logger(spdlog::level::level_enum level) {
    // Drop a logger of a previous call, since registering the same name twice throws:
    spdlog::drop("bt_acquire");
    std::shared_ptr<spdlog::logger> logger = spdlog::stdout_color_mt("bt_acquire");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
    SPDLOG_DEBUG("Logger initialized.");
}

spdlog::level::level_enum parse_level(const std::string& name) {
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str() maps unknown names to 'off':
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}
//---------------------------------------------------------------------------
}  // namespace logger
//---------------------------------------------------------------------------
