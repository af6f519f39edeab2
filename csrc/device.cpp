#include "device.h"

#include <fmt/format.h>
#include <torch/cuda.h>
#include <torch/mps.h>
#include <torch/types.h>

#include "errors.h"

namespace narrate {

std::string resolveDevice(std::string_view device) {
    if (device.empty() or device == "auto") {
        if (torch::cuda::is_available()) return "cuda";
        if (torch::mps::is_available()) return "mps";
        return "cpu";
    }
    try {
        return torch::Device(std::string(device)).str();
    } catch (c10::Error const&) {
        throw ValidationError(fmt::format("invalid device '{}'", device));
    }
}

}  // namespace narrate
