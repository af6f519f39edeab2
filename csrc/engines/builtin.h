#pragma once

#include "config.h"
#include "registry.h"

namespace narrate {

// Register chatterbox and chatterbox-turbo, loading models from
// config.modelsDir.
void registerBuiltinEngines(EngineRegistry& registry, Config const& config);

}  // namespace narrate
