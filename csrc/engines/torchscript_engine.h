#pragma once
#include <torch/script.h>

#include <filesystem>
#include <optional>
#include <string>

#include "engine.h"
#include "types.h"

namespace narrate {

// Shared plumbing for engines backed by a TorchScript export. The module
// must provide:
//   attribute sr: int
//   prepare_conditionals(wav: Tensor[nSample], sr: int, exaggeration: float)
//       -> Any
//   generate(text: str, conds: Any, exaggeration: float, cfg_weight: float,
//            temperature: float, repetition_penalty: float) -> Tensor
struct TorchScriptEngine : Engine {
    EngineDescriptor const& descriptor() const override { return desc; }
    ParameterList const& parameters() const override { return params; }

   protected:
    TorchScriptEngine(EngineDescriptor desc, ParameterList params,
                      std::filesystem::path modelsDir);

    // Load file onto device unless this exact pair is already loaded.
    // A reload drops the prepared voice. Returns true if a load happened.
    bool loadModule(std::string const& device, std::filesystem::path const& file);

    void prepareConditionals(std::filesystem::path const& voicePath,
                             double exaggeration);

    SynthesisResult generateWave(std::string const& text, double exaggeration,
                                 double cfgWeight, double temperature,
                                 double repetitionPenalty);

    EngineDescriptor desc;
    ParameterList params;
    std::filesystem::path modelsDir;

   private:
    std::optional<torch::jit::Module> module{};
    std::string loadedDevice{};
    std::filesystem::path loadedFile{};
    int64_t sampleRate{};
    IValue conditionals{};
};

}  // namespace narrate
