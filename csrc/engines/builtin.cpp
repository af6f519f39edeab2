#include "engines/builtin.h"

#include <memory>

#include "engines/chatterbox.h"

namespace narrate {

void registerBuiltinEngines(EngineRegistry& registry, Config const& config) {
    auto modelsDir = config.modelsDir;
    registry.registerEngine(ChatterboxEngine::describe(),
                            ChatterboxEngine::describeParameters(), [modelsDir] {
        return std::make_shared<ChatterboxEngine>(modelsDir);
    });
    registry.registerEngine(ChatterboxTurboEngine::describe(),
                            ChatterboxTurboEngine::describeParameters(),
                            [modelsDir] {
        return std::make_shared<ChatterboxTurboEngine>(modelsDir);
    });
}

}  // namespace narrate
