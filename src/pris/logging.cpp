#include <pris/logging.h>

#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

namespace pris {

Result<void> configureLogging(const Config& config) {
    std::string name = config.get<std::string>(Config::KEY_LOG_LEVEL, "info");

    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return Err<void>("Unknown log level '" + name + "'");
    }

    spdlog::set_level(level);
    spdlog::cfg::load_env_levels();
    ydebug("Log level set to {}", name);
    return Ok();
}

} // namespace pris
