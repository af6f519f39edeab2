#include "audio.h"

#include <fmt/format.h>
#include <sndfile.h>
#include <sox.h>
#include <soxr.h>
#include <torch/types.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>
#include <string_view>

#include "errors.h"

namespace narrate {

std::once_flag once_format_init{};

AudioFile::AudioFile(std::string_view path) : path{path} {
    std::call_once(once_format_init, [] { sox_format_init(); });
    pt = sox_open_read(this->path.c_str(), nullptr, nullptr, nullptr);
    if (pt == nullptr) {
        throw IOError("failed to open audio file at path: " + this->path);
    }
    rate = pt->signal.rate;
    channels = std::max(pt->signal.channels, 1u);
    length = pt->signal.length / channels;
}

// For multi-channels audio, sox_read will return the channels interleaved.
// wave (FloatTensor): [length, channels].
Tensor AudioFile::wave() const {
    Tensor wave = torch::empty(
        {static_cast<int64_t>(length), static_cast<int64_t>(channels)},
        torch::kInt32);
    auto cnt = sox_read(pt, wave.data_ptr<int32_t>(), length * channels);

    if (cnt == 0 and length != 0) {
        throw IOError("failed to read audio file at path: " + this->path);
    }
    // sox_sample_t is a left-aligned 32-bit integer.
    return wave.to(torch::kFloat32) / 2147483648.0;
}

AudioFile::~AudioFile() noexcept {
    if (pt != nullptr) sox_close(pt);
}

std::pair<Tensor, double> readAudio(std::string_view path) {
    auto file = AudioFile(path);
    auto wave = file.wave();
    return {wave, file.rate};
}

Tensor downmix(Tensor wave) {
    if (wave.dim() == 1) return wave;
    return wave.mean(1);
}

Tensor resample(Tensor wave, double inRate, double outRate) {
    if (inRate == outRate) return wave;
    Tensor in_wave = wave.to(torch::kFloat32).contiguous();
    size_t in_length = in_wave.numel();
    size_t out_length = static_cast<size_t>(in_length * outRate / inRate + .5);
    Tensor out_wave = torch::zeros({static_cast<int64_t>(out_length)},
                                   torch::kFloat32);

    soxr_io_spec_t const io_spec = soxr_io_spec(SOXR_FLOAT32_I, SOXR_FLOAT32_I);
    soxr_quality_spec_t const quality_spec = soxr_quality_spec(SOXR_HQ, 0);

    size_t out_done = 0;
    soxr_error_t err = soxr_oneshot(
        inRate, outRate, 1, in_wave.data_ptr<float>(), in_length, nullptr,
        out_wave.data_ptr<float>(), out_length, &out_done, &io_spec,
        &quality_spec, nullptr);
    if (err != nullptr) {
        throw IOError(fmt::format("failed to resample from {} Hz to {} Hz: {}",
                                  inRate, outRate, err));
    }
    return out_wave.slice(0, 0, static_cast<int64_t>(out_done));
}

struct SndfileCloser {
    void operator()(SNDFILE* sf) const { sf_close(sf); }
};

// wave (FloatTensor): [nSample]. Frames are written as they are, so values
// outside [-1, 1] and denormal-range tails survive.
void wavSaveFloat(Tensor wave, std::filesystem::path const& path, double sr) {
    Tensor samples = wave.to(torch::kFloat32).contiguous().view({-1});
    auto length = static_cast<sf_count_t>(samples.numel());

    SF_INFO info{};
    info.samplerate = static_cast<int>(std::lround(sr));
    info.channels = 1;
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;
    if (info.samplerate <= 0 or not sf_format_check(&info)) {
        throw IOError(fmt::format("unsupported output format at {} Hz", sr));
    }

    auto sf = std::unique_ptr<SNDFILE, SndfileCloser>(
        sf_open(path.c_str(), SFM_WRITE, &info));
    if (sf == nullptr) {
        throw IOError(fmt::format("failed to open file at path: {}: {}",
                                  path.string(), sf_strerror(nullptr)));
    }

    sf_count_t cnt = sf_writef_float(sf.get(), samples.data_ptr<float>(), length);
    if (cnt != length) {
        throw IOError(fmt::format("failed to write file at path: {}: {}",
                                  path.string(), sf_strerror(sf.get())));
    }
    if (sf_close(sf.release()) != 0) {
        throw IOError("failed to finalize file at path: " + path.string());
    }
}

}  // namespace narrate
