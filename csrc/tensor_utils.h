#pragma once
#include <torch/torch.h>

#include <cmath>
#include <cstdint>

#include "types.h"

namespace narrate {

// Normalize whatever a backend returned into a host FloatTensor[nSample]:
// detached, on CPU, float32, squeezed and flattened.
inline Tensor toHostWave(Tensor t) {
    return t.detach()
        .to(torch::kCPU, torch::kFloat32)
        .squeeze()
        .reshape({-1})
        .contiguous();
}

// FloatTensor[n] of zeros lasting `seconds` at rate sr.
inline Tensor silence(double seconds, int64_t sr) {
    auto n = static_cast<int64_t>(std::llround(seconds * static_cast<double>(sr)));
    return torch::zeros({n}, torch::kFloat32);
}

// Concatenate 1-D waves in order. An empty list yields an empty wave.
inline Tensor concatWaves(TensorList const& waves) {
    if (waves.empty()) return torch::zeros({0}, torch::kFloat32);
    return torch::cat(waves, 0);
}

}  // namespace narrate
