#pragma once

#include <optional>
#include <string>
#include <vector>

#include "canonical.h"
#include "types.h"

namespace narrate {

// Describes a single configurable parameter of an engine. Front ends read
// the ordered list to build their option panels.
struct ParameterDescriptor {
    // Key in the parameter map handed to the engine. Unique per engine.
    std::string id;
    // Fallback display name, used when canonical is unset or unknown.
    std::string label;
    ParamType type{ParamType::Float};
    // No default means the value must be supplied.
    std::optional<ParamValue> defaultValue{};
    bool required{false};
    std::string description{};
    // (label, value) pairs, only for ParamType::Choice.
    OptionList options{};
    std::optional<double> minValue{};
    std::optional<double> maxValue{};
    // Id into the canonical table, e.g. "speed" or "emotion".
    std::optional<std::string> canonical{};
};

using ParameterList = std::vector<ParameterDescriptor>;

// What a front end shows for a descriptor after canonical normalization.
struct ParameterDisplay {
    std::string label;
    std::string description;
    std::optional<double> minValue{};
    std::optional<double> maxValue{};
};

// Canonical label and description win when the descriptor references a
// known canonical entry. The canonical range wins only when it has one.
ParameterDisplay displayOf(ParameterDescriptor const& p);

// Validate raw front-end values against the declared descriptors.
// Returns one entry per descriptor, converted to its declared type:
//   Float -> double, Int -> int64_t, String / Choice -> std::string.
// Throws ValidationError on a type or range mismatch and NotFoundError when
// a required value is absent. Undeclared keys are dropped.
ParamMap coerceParameters(ParameterList const& descriptors, ParamMap const& raw);

}  // namespace narrate
