#pragma once

#include <filesystem>
#include <string>

#include "log.h"

namespace narrate {

struct Config {
    // Root of the TorchScript model tree, see csrc/engines.
    std::filesystem::path modelsDir{"models"};
    // One of "auto", "cuda", "mps", "cpu" or any torch device string.
    std::string defaultDevice{"auto"};
    // Silence inserted between two consecutive chunks.
    double pauseSeconds{0.3};
    std::string defaultFilename{"output.wav"};
    LogLevel logLevel{LogLevel::Info};

    // Defaults overlaid with NARRATE_MODELS_DIR, NARRATE_DEVICE and
    // NARRATE_LOG_LEVEL when they are set.
    static Config fromEnvironment();
};

}  // namespace narrate
