#pragma once
#include <sox.h>
#include <soxr.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "types.h"

namespace narrate {

struct AudioFile {
    sox_format_t* pt{};
    sox_rate_t rate{};
    // Frames, i.e. samples per channel.
    size_t length{};
    unsigned channels{};
    std::string path{};
    AudioFile() = default;
    explicit AudioFile(std::string_view path);
    AudioFile(AudioFile const&) = delete;
    AudioFile& operator=(AudioFile const&) = delete;

    [[nodiscard]] Tensor wave() const;
    ~AudioFile() noexcept;
};

// Read an audio file in any container sox understands.
// Returns FloatTensor[nSample, nChannel] in [-1, 1] and the sampling rate.
// Throws IOError when the file cannot be opened or decoded.
std::pair<Tensor, double> readAudio(std::string_view path);

// Average the channels of FloatTensor[nSample, nChannel] into [nSample].
Tensor downmix(Tensor wave);

// Resample a mono FloatTensor[nSample] from inRate to outRate.
// Implemented with soxr at high quality.
Tensor resample(Tensor wave, double inRate, double outRate);

// Save a mono FloatTensor[nSample] as a 32-bit float WAV file with
// libsndfile. Samples are stored unclamped.
// Throws IOError when the file cannot be written.
void wavSaveFloat(Tensor wave, std::filesystem::path const& path, double sr);

}  // namespace narrate
