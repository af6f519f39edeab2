#include "engines/torchscript_engine.h"

#include <fmt/format.h>
#include <torch/script.h>
#include <torch/torch.h>

#include <utility>

#include "audio.h"
#include "errors.h"
#include "log.h"

namespace narrate {

TorchScriptEngine::TorchScriptEngine(EngineDescriptor desc, ParameterList params,
                                     std::filesystem::path modelsDir)
    : desc{std::move(desc)},
      params{std::move(params)},
      modelsDir{std::move(modelsDir)} {}

bool TorchScriptEngine::loadModule(std::string const& device,
                                   std::filesystem::path const& file) {
    if (module.has_value() and loadedDevice == device and loadedFile == file) {
        return false;
    }
    std::error_code ec;
    if (not std::filesystem::is_regular_file(file, ec)) {
        throw EngineError(fmt::format("{}: model not found at {}", desc.name,
                                      file.string()));
    }

    // Drop the old model before loading the next one onto the device.
    module.reset();
    conditionals = IValue();
    try {
        auto m = torch::jit::load(file.string(), torch::Device(device));
        m.eval();
        sampleRate = m.attr("sr").toInt();
        module = std::move(m);
    } catch (c10::Error const& e) {
        throw EngineError(fmt::format("{}: failed to load {}: {}", desc.name,
                                      file.string(), e.what_without_backtrace()));
    }
    loadedDevice = device;
    loadedFile = file;
    return true;
}

void TorchScriptEngine::prepareConditionals(
    std::filesystem::path const& voicePath, double exaggeration) {
    if (not module.has_value()) {
        throw EngineError(desc.name + ": prepareVoice called before load");
    }
    torch::NoGradGuard no_grad;
    try {
        auto [wave, rate] = readAudio(voicePath.string());
        Tensor mono = resample(downmix(wave), rate, static_cast<double>(sampleRate));
        mono = mono.to(torch::Device(loadedDevice), torch::kFloat32);
        conditionals = module->run_method("prepare_conditionals", mono,
                                          sampleRate, exaggeration);
    } catch (c10::Error const& e) {
        throw EngineError(fmt::format("{}: failed to prepare voice {}: {}",
                                      desc.name, voicePath.string(),
                                      e.what_without_backtrace()));
    } catch (IOError const& e) {
        throw EngineError(fmt::format("{}: failed to prepare voice: {}",
                                      desc.name, e.what()));
    }
}

SynthesisResult TorchScriptEngine::generateWave(std::string const& text,
                                                double exaggeration,
                                                double cfgWeight,
                                                double temperature,
                                                double repetitionPenalty) {
    if (not module.has_value()) {
        throw EngineError(desc.name + ": synthesize called before load");
    }
    if (desc.requiresVoiceFile and conditionals.isNone()) {
        throw EngineError(desc.name + ": no voice prepared");
    }
    torch::NoGradGuard no_grad;
    try {
        auto out = module->run_method("generate", text, conditionals,
                                      exaggeration, cfgWeight, temperature,
                                      repetitionPenalty);
        return {out.toTensor(), sampleRate};
    } catch (c10::Error const& e) {
        throw EngineError(fmt::format("{}: generation failed: {}", desc.name,
                                      e.what_without_backtrace()));
    }
}

}  // namespace narrate
