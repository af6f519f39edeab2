#pragma once

#include <tbb/concurrent_hash_map.h>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine.h"
#include "params.h"
#include "types.h"

namespace narrate {

// Name-keyed directory of backends. Instances are built lazily by their
// factory on first access and shared by every later caller.
//
// Construct one registry at process start, register the engines, then pass
// it by reference to whoever generates.
class EngineRegistry {
   public:
    EngineRegistry() = default;
    EngineRegistry(EngineRegistry const&) = delete;
    EngineRegistry& operator=(EngineRegistry const&) = delete;

    // Throws ValidationError if the name is empty or already registered.
    void registerEngine(EngineDescriptor descriptor, EngineFactory factory);

    // As above, also declaring the engine's parameters so requests can be
    // validated before the instance exists.
    void registerEngine(EngineDescriptor descriptor, ParameterList parameters,
                        EngineFactory factory);

    // Descriptor of a registered engine, without building the instance.
    // Throws NotFoundError listing the registered names.
    EngineDescriptor descriptor(std::string_view name) const;

    // Declared parameters of a registered engine. Builds the instance only
    // when none were given at registration.
    ParameterList parameters(std::string_view name);

    // The cached instance, built on first access. Concurrent first calls for
    // the same name build exactly one instance.
    // Throws NotFoundError listing the registered names.
    EngineHandle get(std::string_view name);

    bool contains(std::string_view name) const;

    // (displayName, name) pairs in registration order.
    EngineList list() const;

    StringList names() const;

   private:
    struct Entry {
        EngineDescriptor descriptor;
        std::optional<ParameterList> parameters;
        EngineFactory factory;
    };
    using InstanceMap = tbb::concurrent_hash_map<std::string, EngineHandle>;

    void add(Entry entry);
    Entry const& find(std::string_view name) const;
    [[noreturn]] void throwUnknown(std::string_view name) const;

    mutable std::mutex lock{};
    std::vector<Entry> entries{};
    InstanceMap instances{};
};

}  // namespace narrate
