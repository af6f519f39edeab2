#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.h"

namespace narrate {

enum class ParamType { Float, Int, String, Choice };

std::string_view toString(ParamType type);

// User-facing definition of a normalized control. Several engines may map
// their own differently named parameters (pace, rate, speaking_rate) onto
// one canonical entry (speed).
struct CanonicalParameter {
    std::string id;
    std::string label;
    std::string description;
    ParamType type{ParamType::Float};
    ParamValue defaultValue{};
    std::optional<double> minValue{};
    std::optional<double> maxValue{};
};

// The fixed table, in display order.
std::vector<CanonicalParameter> const& canonicalParameters();

// Returns the registered record for id, or nullptr when id is empty or
// unknown. The returned pointer stays valid for the process lifetime.
CanonicalParameter const* resolveCanonical(std::optional<std::string_view> id);

}  // namespace narrate
