#include "generate.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <system_error>
#include <utility>

#include "audio.h"
#include "device.h"
#include "errors.h"
#include "log.h"
#include "tensor_utils.h"
#include "text/chunker.h"
#include "text/utils.h"

namespace narrate {

namespace fs = std::filesystem;

namespace {

bool endsWithWav(std::string const& name) {
    if (name.size() < 4) return false;
    auto suffix = name.substr(name.size() - 4);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return suffix == ".wav";
}

// Run one engine call; anything it throws becomes an EngineError.
template <typename Func>
auto engineCall(std::string const& engine, std::string_view step, Func&& func) {
    try {
        return func();
    } catch (EngineError const&) {
        throw;
    } catch (std::exception const& e) {
        throw EngineError(
            fmt::format("engine '{}' failed in {}: {}", engine, step, e.what()));
    }
}

void writeOutput(Tensor const& wave, fs::path const& outPath, int64_t sr) {
    std::error_code ec;
    fs::create_directories(outPath.parent_path(), ec);
    if (ec) {
        throw IOError(fmt::format("failed to create output directory {}: {}",
                                  outPath.parent_path().string(), ec.message()));
    }

    // Write next to the target and rename, so a failure never leaves a
    // truncated file at outPath.
    auto partial = outPath;
    partial += ".partial";
    try {
        wavSaveFloat(wave, partial, static_cast<double>(sr));
        fs::rename(partial, outPath);
    } catch (std::exception const& e) {
        fs::remove(partial, ec);
        if (dynamic_cast<IOError const*>(&e) != nullptr) throw;
        throw IOError(fmt::format("failed to write {}: {}", outPath.string(),
                                  e.what()));
    }
}

}  // namespace

fs::path resolveOutputPath(GenerationRequest const& request,
                           Config const& config) {
    auto name = request.outputFilename.empty() ? config.defaultFilename
                                               : request.outputFilename;
    if (not endsWithWav(name)) name += ".wav";
    return fs::absolute(request.outputDir / name).lexically_normal();
}

fs::path generate(EngineRegistry& registry, GenerationRequest const& request,
                  Config const& config) {
    // Everything up to load() must fail before any backend work starts.
    auto text = trim(request.text);
    if (text.empty()) {
        throw ValidationError("text must not be empty");
    }

    auto const descriptor = registry.descriptor(request.engineName);
    if (descriptor.requiresVoiceFile) {
        std::error_code ec;
        if (not request.voicePath or
            not fs::is_regular_file(*request.voicePath, ec)) {
            throw NotFoundError(fmt::format(
                "voice file not found: {}",
                request.voicePath ? request.voicePath->string() : "<none>"));
        }
    }

    auto const params = coerceParameters(registry.parameters(request.engineName),
                                         request.parameters);
    auto const device = resolveDevice(
        request.device.empty() ? config.defaultDevice : request.device);
    auto const outPath = resolveOutputPath(request, config);
    auto engine = registry.get(request.engineName);
    auto const& name = descriptor.name;

    const std::lock_guard<std::mutex> lg(engine->lock);

    // Skipped by the engine when (device, load parameters) are unchanged.
    engineCall(name, "load", [&] { engine->load(device, params); });

    // Prepared once, reused by every chunk.
    if (descriptor.requiresVoiceFile) {
        engineCall(name, "prepareVoice",
                   [&] { engine->prepareVoice(*request.voicePath, params); });
    }

    auto chunks = chunkText(text, descriptor.chunkChars);
    logInfo("Generating {} chunk(s)  ({} chars total)", chunks.size(),
            utf8Length(text));

    TensorList parts;
    int64_t sr = 0;
    for (auto const& chunk : chunks) {
        logInfo("  Chunk {}/{}: {} chars", chunk.index, chunks.size(),
                utf8Length(chunk.text));
        auto result = engineCall(name, "synthesize", [&] {
            return engine->synthesize(chunk.text, params);
        });
        auto const rate = result.sampleRate;
        if (rate <= 0) {
            throw EngineError(fmt::format(
                "engine '{}' returned an invalid sample rate {}", name, rate));
        }
        Tensor wave = engineCall(name, "synthesize",
                                 [&] { return toHostWave(result.samples); });

        if (chunk.index == 1) {
            sr = rate;
        } else if (rate != sr) {
            logWarn("chunk {} is at {} Hz, resampling to {} Hz", chunk.index,
                    rate, sr);
            wave = engineCall(name, "synthesize", [&] {
                return resample(wave, static_cast<double>(rate),
                                static_cast<double>(sr));
            });
        }
        parts.push_back(std::move(wave));

        // Natural pause between chunks.
        if (chunk.index < chunks.size()) {
            parts.push_back(silence(config.pauseSeconds, sr));
        }
    }

    Tensor full = concatWaves(parts);
    writeOutput(full, outPath, sr);
    logInfo("Saved: {}  ({} Hz, {:.1f}s)", outPath.string(), sr,
            static_cast<double>(full.numel()) / static_cast<double>(sr));
    return outPath;
}

}  // namespace narrate
