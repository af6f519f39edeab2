#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "params.h"
#include "types.h"

namespace narrate {

// Identity of a backend. Fixed at registration time.
struct EngineDescriptor {
    // Unique slug, e.g. "chatterbox".
    std::string name;
    // Shown by front ends, e.g. "Chatterbox".
    std::string displayName;
    // prepareVoice is called only when this is set.
    bool requiresVoiceFile{true};
    // Maximum characters per synthesize call. Engines with tighter context
    // windows set a smaller value.
    size_t chunkChars{800};
};

// Audio produced for one chunk. samples may have any shape, dtype or device;
// the orchestrator flattens it to host float32.
struct SynthesisResult {
    Tensor samples;
    int64_t sampleRate{};
};

// Interface every speech backend implements.
//
// Lifecycle per generation request:
//   load(device, params)            idempotent, cached on (device, config)
//   prepareVoice(voicePath, params) only if requiresVoiceFile
//   synthesize(chunk, params)       once per chunk, in order
//
// A load with a changed configuration invalidates a prepared voice. All
// methods report failures as EngineError. params is the map returned by
// coerceParameters for parameters().
struct Engine {
    // Held by the orchestrator for a whole request. One instance is never
    // used by two requests at once.
    std::mutex lock{};

    virtual EngineDescriptor const& descriptor() const = 0;

    // Ordered list of engine parameters. Ids are unique.
    virtual ParameterList const& parameters() const = 0;

    // device is already resolved, i.e. never "auto".
    virtual void load(std::string const& device, ParamMap const& params) = 0;

    virtual void prepareVoice(std::filesystem::path const& voicePath,
                              ParamMap const& params) = 0;

    virtual SynthesisResult synthesize(std::string const& text,
                                       ParamMap const& params) = 0;

    virtual ~Engine() = default;

   protected:
    Engine() = default;
};

}  // namespace narrate
