#pragma once

#include <string>
#include <string_view>

namespace narrate {

// Resolve "auto" to the best available torch device: cuda, then mps, then
// cpu. Any other value is validated by torch and returned unchanged.
// Throws ValidationError for a string torch does not recognize.
std::string resolveDevice(std::string_view device);

}  // namespace narrate
