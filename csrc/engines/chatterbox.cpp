#include "engines/chatterbox.h"

#include <utility>

#include "log.h"

namespace narrate {

namespace {

OptionList const languages{
    {"English", "English"}, {"German", "German"},
    {"French", "French"},   {"Norwegian", "Norwegian"},
    {"Italian", "Italian"}, {"Spanish", "Spanish"},
    {"Russian", "Russian"}, {"Arabic", "Arabic"},
    {"Turkish", "Turkish"}, {"Vietnamese", "Vietnamese"},
};

// Inline markers the turbo model performs in the cloned voice.
constexpr auto tagsHint =
    "[laugh] [chuckle] [sigh] [gasp] [cough] [groan] [sniff] [clear throat]";

// The library default; suppresses looping on long chunks.
constexpr double defaultRepetitionPenalty = 1.2;

double real(ParamMap const& params, std::string const& key) {
    return std::get<double>(params.at(key));
}

}  // namespace

ChatterboxEngine::ChatterboxEngine(std::filesystem::path modelsDir)
    : TorchScriptEngine(describe(), describeParameters(), std::move(modelsDir)) {}

EngineDescriptor ChatterboxEngine::describe() {
    return {.name = "chatterbox",
            .displayName = "Chatterbox",
            .requiresVoiceFile = true,
            .chunkChars = 800};
}

ParameterList ChatterboxEngine::describeParameters() {
    return {
        {.id = "language",
         .label = "Language",
         .type = ParamType::Choice,
         .defaultValue = "English"s,
         .description = "Language model variant",
         .options = languages,
         .canonical = "language"},
        {.id = "exaggeration",
         .label = "Exaggeration",
         .type = ParamType::Float,
         .defaultValue = 0.5,
         .description = "Emotion intensity  (0 - 1.5)",
         .minValue = 0.0,
         .maxValue = 1.5},
        {.id = "temperature",
         .label = "Temperature",
         .type = ParamType::Float,
         .defaultValue = 0.8,
         .description = "Sampling randomness  (0.1 - 1.5)",
         .minValue = 0.1,
         .maxValue = 1.5},
        {.id = "cfg_weight",
         .label = "CFG Weight",
         .type = ParamType::Float,
         .defaultValue = 0.5,
         .description = "Guidance strength  (0 - 1)",
         .minValue = 0.0,
         .maxValue = 1.0},
    };
}

void ChatterboxEngine::load(std::string const& device, ParamMap const& params) {
    auto const& language = std::get<std::string>(params.at("language"));
    auto file = modelsDir / "chatterbox" / language / "model.pt";
    if (loadModule(device, file)) {
        logInfo("Loading Chatterbox  language={}  device={}", language, device);
    }
}

void ChatterboxEngine::prepareVoice(std::filesystem::path const& voicePath,
                                    ParamMap const& params) {
    prepareConditionals(voicePath, real(params, "exaggeration"));
}

SynthesisResult ChatterboxEngine::synthesize(std::string const& text,
                                             ParamMap const& params) {
    return generateWave(text, real(params, "exaggeration"),
                        real(params, "cfg_weight"), real(params, "temperature"),
                        defaultRepetitionPenalty);
}

ChatterboxTurboEngine::ChatterboxTurboEngine(std::filesystem::path modelsDir)
    : TorchScriptEngine(describe(), describeParameters(), std::move(modelsDir)) {}

EngineDescriptor ChatterboxTurboEngine::describe() {
    return {.name = "chatterbox-turbo",
            .displayName = "Chatterbox Turbo",
            .requiresVoiceFile = true,
            .chunkChars = 400};
}

ParameterList ChatterboxTurboEngine::describeParameters() {
    return {
        {.id = "exaggeration",
         .label = "Exaggeration",
         .type = ParamType::Float,
         .defaultValue = 0.5,
         .description = "Emotion intensity  (0 - 1.5)",
         .minValue = 0.0,
         .maxValue = 1.5,
         .canonical = "emotion"},
        {.id = "temperature",
         .label = "Temperature",
         .type = ParamType::Float,
         .defaultValue = 0.8,
         .description = "Sampling randomness  (0.1 - 1.5)",
         .minValue = 0.1,
         .maxValue = 1.5,
         .canonical = "temperature"},
        {.id = "cfg_weight",
         .label = "CFG Weight",
         .type = ParamType::Float,
         .defaultValue = 0.0,
         .description = "Guidance strength, keep near 0 for Turbo  (0 - 1)",
         .minValue = 0.0,
         .maxValue = 1.0,
         .canonical = "guidance"},
        // Read-only hint, ignored at generation time.
        {.id = "_tags_hint",
         .label = "Paralinguistic Tags",
         .type = ParamType::String,
         .defaultValue = std::string(tagsHint),
         .description = "Place these tags inline in your script to trigger "
                        "natural vocal reactions"},
    };
}

void ChatterboxTurboEngine::load(std::string const& device, ParamMap const&) {
    if (loadModule(device, modelsDir / "chatterbox-turbo" / "model.pt")) {
        logInfo("Loading Chatterbox Turbo  device={}", device);
    }
}

void ChatterboxTurboEngine::prepareVoice(std::filesystem::path const& voicePath,
                                         ParamMap const& params) {
    prepareConditionals(voicePath, real(params, "exaggeration"));
}

// Repetition penalty is disabled: natural speech reuses the same sounds
// constantly, and penalizing them causes growing silence and stutter.
SynthesisResult ChatterboxTurboEngine::synthesize(std::string const& text,
                                                  ParamMap const& params) {
    return generateWave(text, real(params, "exaggeration"),
                        real(params, "cfg_weight"), real(params, "temperature"),
                        1.0);
}

}  // namespace narrate
