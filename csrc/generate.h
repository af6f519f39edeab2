#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config.h"
#include "registry.h"
#include "types.h"

namespace narrate {

struct GenerationRequest {
    std::string text;
    // Reference voice. Required only by engines that declare it.
    std::optional<std::filesystem::path> voicePath{};
    std::filesystem::path outputDir{"."};
    // Empty means Config::defaultFilename. ".wav" is appended if missing.
    std::string outputFilename{};
    std::string engineName{"chatterbox"};
    // Empty means Config::defaultDevice.
    std::string device{};
    // Raw engine parameter values, coerced against Engine::parameters().
    ParamMap parameters{};
};

// Absolute path the request will be written to.
std::filesystem::path resolveOutputPath(GenerationRequest const& request,
                                        Config const& config);

// Synthesize request.text with the named engine and write a single 32-bit
// float WAV file. Long text is split into sentence-bounded chunks that are
// synthesized in order and joined with a short pause.
//
// Returns the absolute path of the written file. Throws ValidationError,
// NotFoundError, EngineError or IOError; on any error no file is left at the
// output path.
std::filesystem::path generate(EngineRegistry& registry,
                               GenerationRequest const& request,
                               Config const& config = {});

}  // namespace narrate
