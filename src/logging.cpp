#include "logging.hpp"
#include "error.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace assetlock::logging {

namespace {
constexpr const char* LOG_PATTERN = "%Y-%m-%dT%H:%M:%S.%e|%-5l|%n|%t|%v";

bool init_pattern() {
    spdlog::set_pattern(LOG_PATTERN);
    return true;
}
} // namespace

Logger get_logger(const std::string& name) {
    static const bool initialized = init_pattern();
    (void)initialized;

    Logger logger = spdlog::get(name);
    if (logger == nullptr) {
        // another thread may register the same name between get and create
        try {
            logger = spdlog::stderr_color_mt(name);
        } catch (const spdlog::spdlog_ex&) {
            logger = spdlog::get(name);
        }
    }
    return logger;
}

void set_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw AssetLockError(AssetLockError::ErrorType::ConfigError, "Unknown log level: " + level);
    }
    spdlog::set_level(parsed);
}

} // namespace assetlock::logging
