#include <boost/test/unit_test.hpp>

#include <torch/torch.h>

#include <sndfile.h>

#include <cmath>
#include <vector>

#include "audio.h"
#include "errors.h"
#include "stub_engine.h"
#include "tensor_utils.h"

using namespace narrate;
using namespace narrate::testing;

BOOST_AUTO_TEST_SUITE(audio)

BOOST_AUTO_TEST_CASE(backend_output_is_flattened_to_host_float) {
    auto t = torch::ones({1, 1, 5}, torch::kFloat64);
    auto w = toHostWave(t);
    BOOST_TEST(w.dim() == 1);
    BOOST_TEST(w.numel() == 5);
    BOOST_TEST((w.scalar_type() == torch::kFloat32));
    BOOST_TEST(w.device().is_cpu());

    auto grad = torch::ones({3}, torch::requires_grad());
    BOOST_TEST(not toHostWave(grad * 2).requires_grad());

    // A single sample survives squeeze as a one-element wave.
    BOOST_TEST(toHostWave(torch::ones({1, 1})).dim() == 1);
}

BOOST_AUTO_TEST_CASE(silence_length_follows_rate) {
    BOOST_TEST(silence(0.3, 24000).numel() == 7200);
    BOOST_TEST(silence(0.3, 22050).numel() == 6615);
    BOOST_TEST(silence(0.3, 24000).abs().sum().item<float>() == 0.0f);
}

BOOST_AUTO_TEST_CASE(concatenation_keeps_order) {
    auto w = concatWaves({torch::full({2}, 1.0), torch::full({3}, 2.0)});
    BOOST_TEST(w.numel() == 5);
    BOOST_TEST(w[1].item<float>() == 1.0f);
    BOOST_TEST(w[2].item<float>() == 2.0f);
    BOOST_TEST(concatWaves({}).numel() == 0);
}

BOOST_AUTO_TEST_CASE(downmix_averages_channels) {
    auto stereo = torch::stack({torch::full({4}, 0.2), torch::full({4}, 0.6)}, 1);
    auto mono = downmix(stereo);
    BOOST_TEST(mono.dim() == 1);
    BOOST_TEST(mono.numel() == 4);
    BOOST_TEST(std::abs(mono[0].item<float>() - 0.4f) < 1e-6f);
}

BOOST_AUTO_TEST_CASE(resample_changes_length_by_rate_ratio) {
    auto wave = torch::sin(torch::arange(24000, torch::kFloat32) * 0.05);
    BOOST_TEST(std::abs(resample(wave, 24000, 16000).numel() - 16000) <= 2);
    BOOST_TEST(resample(wave, 24000, 24000).numel() == 24000);
}

BOOST_AUTO_TEST_CASE(float_wav_keeps_rate_and_samples) {
    TempDir dir;
    auto path = dir.path / "tone.wav";
    auto wave = torch::sin(torch::arange(2205, torch::kFloat32) * 0.1) * 0.8;
    wavSaveFloat(wave, path, 22050);

    auto [read, rate] = readAudio(path.string());
    BOOST_TEST(rate == 22050.0);
    BOOST_REQUIRE_EQUAL(read.size(0), 2205);
    BOOST_TEST(read.size(1) == 1);
    BOOST_TEST(torch::allclose(read.squeeze(1), wave, 1e-6, 1e-6));
}

BOOST_AUTO_TEST_CASE(float_wav_stores_samples_unchanged) {
    TempDir dir;
    auto path = dir.path / "wide.wav";
    std::vector<float> written{1.5f, 1e-10f, -2.0f, 0.25f, -1e-10f};
    wavSaveFloat(torch::tensor(written), path, 24000);

    SF_INFO info{};
    SNDFILE* sf = sf_open(path.c_str(), SFM_READ, &info);
    BOOST_REQUIRE(sf != nullptr);
    BOOST_TEST(info.samplerate == 24000);
    BOOST_TEST(info.channels == 1);
    BOOST_TEST((info.format & SF_FORMAT_SUBMASK) == SF_FORMAT_FLOAT);
    BOOST_TEST((info.format & SF_FORMAT_TYPEMASK) == SF_FORMAT_WAV);

    std::vector<float> read(written.size());
    auto n = sf_readf_float(sf, read.data(), static_cast<sf_count_t>(read.size()));
    sf_close(sf);
    BOOST_REQUIRE_EQUAL(n, static_cast<sf_count_t>(written.size()));
    BOOST_TEST(read == written, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(unreadable_and_unwritable_paths_are_io_errors) {
    TempDir dir;
    BOOST_CHECK_THROW(readAudio((dir.path / "missing.wav").string()), IOError);
    BOOST_CHECK_THROW(
        wavSaveFloat(torch::zeros({10}), dir.path / "no" / "such" / "dir.wav",
                     16000),
        IOError);
}

BOOST_AUTO_TEST_SUITE_END()
