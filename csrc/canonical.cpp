#include "canonical.h"

#include <algorithm>

namespace narrate {

std::string_view toString(ParamType type) {
    switch (type) {
        case ParamType::Float:
            return "float";
        case ParamType::Int:
            return "int";
        case ParamType::String:
            return "str";
        case ParamType::Choice:
            return "select";
    }
    return "unknown";
}

std::vector<CanonicalParameter> const& canonicalParameters() {
    static auto const table = std::vector<CanonicalParameter>{
        // Prosody
        {"speed", "Speed",
         "Speaking rate  (1.0 = normal, 0.5 = half, 2.0 = double)",
         ParamType::Float, 1.0, 0.1, 3.0},
        {"pitch", "Pitch", "Voice pitch offset in semitones  (0 = unchanged)",
         ParamType::Float, 0.0, -12.0, 12.0},
        {"volume", "Volume", "Output loudness multiplier  (1.0 = unchanged)",
         ParamType::Float, 1.0, 0.0, 2.0},

        // Voice character
        {"emotion", "Emotion",
         "Emotional expressiveness / exaggeration  (0 - 1.5)",
         ParamType::Float, 0.5, 0.0, 1.5},

        // Sampling / model
        {"temperature", "Temperature",
         "Sampling randomness, higher = more varied output  (0.1 - 1.5)",
         ParamType::Float, 0.8, 0.1, 1.5},
        {"guidance", "Guidance",
         "Classifier-free guidance strength  (0 = off, 1 = strong)",
         ParamType::Float, 0.5, 0.0, 1.0},
        {"seed", "Seed",
         "Random seed for reproducible output  (-1 = random each time)",
         ParamType::Int, int64_t{-1}, std::nullopt, std::nullopt},

        // Language / model variant
        {"language", "Language", "Language / model variant", ParamType::Choice,
         "English"s, std::nullopt, std::nullopt},
    };
    return table;
}

CanonicalParameter const* resolveCanonical(std::optional<std::string_view> id) {
    if (not id.has_value()) return nullptr;
    auto const& table = canonicalParameters();
    auto it = std::find_if(table.begin(), table.end(),
                           [&](auto const& entry) { return entry.id == *id; });
    return it == table.end() ? nullptr : &*it;
}

}  // namespace narrate
