#include "registry.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

#include "errors.h"
#include "log.h"

namespace narrate {

void EngineRegistry::registerEngine(EngineDescriptor descriptor,
                                    EngineFactory factory) {
    add({std::move(descriptor), std::nullopt, std::move(factory)});
}

void EngineRegistry::registerEngine(EngineDescriptor descriptor,
                                    ParameterList parameters,
                                    EngineFactory factory) {
    add({std::move(descriptor), std::move(parameters), std::move(factory)});
}

void EngineRegistry::add(Entry entry) {
    auto const& descriptor = entry.descriptor;
    if (descriptor.name.empty()) {
        throw ValidationError("engine name must not be empty");
    }
    if (not entry.factory) {
        throw ValidationError(
            fmt::format("engine '{}' has no factory", descriptor.name));
    }
    const std::lock_guard<std::mutex> lg(lock);
    auto it = std::find_if(entries.begin(), entries.end(), [&](auto const& e) {
        return e.descriptor.name == descriptor.name;
    });
    if (it != entries.end()) {
        throw ValidationError(fmt::format("engine '{}' is already registered",
                                          descriptor.name));
    }
    entries.push_back(std::move(entry));
}

EngineRegistry::Entry const& EngineRegistry::find(std::string_view name) const {
    auto it = std::find_if(entries.begin(), entries.end(), [&](auto const& e) {
        return e.descriptor.name == name;
    });
    if (it == entries.end()) throwUnknown(name);
    return *it;
}

// Caller holds lock.
void EngineRegistry::throwUnknown(std::string_view name) const {
    StringList available;
    for (auto const& e : entries) available.push_back(e.descriptor.name);
    throw NotFoundError(fmt::format("unknown engine '{}'. Available: [{}]", name,
                                    fmt::join(available, ", ")));
}

EngineDescriptor EngineRegistry::descriptor(std::string_view name) const {
    const std::lock_guard<std::mutex> lg(lock);
    return find(name).descriptor;
}

ParameterList EngineRegistry::parameters(std::string_view name) {
    {
        const std::lock_guard<std::mutex> lg(lock);
        auto const& entry = find(name);
        if (entry.parameters.has_value()) return *entry.parameters;
    }
    return get(name)->parameters();
}

EngineHandle EngineRegistry::get(std::string_view name) {
    EngineFactory factory;
    {
        const std::lock_guard<std::mutex> lg(lock);
        factory = find(name).factory;
    }

    // The accessor write-locks this name's slot, so a racing first access
    // waits here until the instance below is built.
    InstanceMap::accessor slot;
    instances.insert(slot, std::string(name));
    if (slot->second == nullptr) {
        logDebug("creating engine '{}'", name);
        auto engine = factory();
        if (engine == nullptr) {
            throw EngineError(
                fmt::format("factory for engine '{}' returned no instance", name));
        }
        slot->second = std::move(engine);
    }
    return slot->second;
}

bool EngineRegistry::contains(std::string_view name) const {
    const std::lock_guard<std::mutex> lg(lock);
    return std::any_of(entries.begin(), entries.end(),
                       [&](auto const& e) { return e.descriptor.name == name; });
}

EngineList EngineRegistry::list() const {
    const std::lock_guard<std::mutex> lg(lock);
    EngineList result;
    result.reserve(entries.size());
    for (auto const& e : entries) {
        result.emplace_back(e.descriptor.displayName, e.descriptor.name);
    }
    return result;
}

StringList EngineRegistry::names() const {
    const std::lock_guard<std::mutex> lg(lock);
    StringList result;
    for (auto const& e : entries) result.push_back(e.descriptor.name);
    return result;
}

}  // namespace narrate
