#include "config.h"

#include <fmt/format.h>

#include <cstdlib>
#include <string_view>

#include "errors.h"

namespace narrate {

LogLevel parseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "off") return LogLevel::Off;
    throw ValidationError(fmt::format(
        "invalid log level '{}', expected debug, info, warn or off", name));
}

Config Config::fromEnvironment() {
    Config config;
    if (char const* dir = std::getenv("NARRATE_MODELS_DIR"); dir && *dir) {
        config.modelsDir = dir;
    }
    if (char const* device = std::getenv("NARRATE_DEVICE"); device && *device) {
        config.defaultDevice = device;
    }
    if (char const* level = std::getenv("NARRATE_LOG_LEVEL"); level && *level) {
        config.logLevel = parseLogLevel(level);
    }
    return config;
}

}  // namespace narrate
