#pragma once

#include <stdexcept>
#include <string>

namespace narrate {

// Base of every error raised by the generation pipeline.
struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed or empty request input.
struct ValidationError final : Error {
    using Error::Error;
};

// Missing voice file, unknown engine name or missing required parameter.
struct NotFoundError final : Error {
    using Error::Error;
};

// Failure inside load / prepareVoice / synthesize. Fatal to the request.
struct EngineError final : Error {
    using Error::Error;
};

// Failure creating the output directory or writing the output file.
struct IOError final : Error {
    using Error::Error;
};

}  // namespace narrate
