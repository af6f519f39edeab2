#pragma once

#include <filesystem>
#include <string>

#include "engines/torchscript_engine.h"

namespace narrate {

// Multilingual Chatterbox. One model per language under
// <models>/chatterbox/<language>/model.pt.
struct ChatterboxEngine final : TorchScriptEngine {
    explicit ChatterboxEngine(std::filesystem::path modelsDir);

    static EngineDescriptor describe();
    static ParameterList describeParameters();

    void load(std::string const& device, ParamMap const& params) override;
    void prepareVoice(std::filesystem::path const& voicePath,
                      ParamMap const& params) override;
    SynthesisResult synthesize(std::string const& text,
                               ParamMap const& params) override;
};

// English-only Chatterbox Turbo at <models>/chatterbox-turbo/model.pt.
// Its 1024-token context is shared by conditioning, text and speech tokens,
// hence the smaller chunk budget.
struct ChatterboxTurboEngine final : TorchScriptEngine {
    explicit ChatterboxTurboEngine(std::filesystem::path modelsDir);

    static EngineDescriptor describe();
    static ParameterList describeParameters();

    void load(std::string const& device, ParamMap const& params) override;
    void prepareVoice(std::filesystem::path const& voicePath,
                      ParamMap const& params) override;
    SynthesisResult synthesize(std::string const& text,
                               ParamMap const& params) override;
};

}  // namespace narrate
