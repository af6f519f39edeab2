#include <pybind11/cast.h>
#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <torch/extension.h>

#include <memory>
#include <mutex>
#include <string_view>

#include "canonical.h"
#include "config.h"
#include "engines/builtin.h"
#include "errors.h"
#include "generate.h"
#include "params.h"
#include "registry.h"
#include "text/chunker.h"
#include "types.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace narrate {

// The process-wide registry front ends share. Built once, from the
// environment configuration, on first use.
EngineRegistry& defaultRegistry() {
    static std::once_flag once{};
    static EngineRegistry registry;
    std::call_once(once, [] {
        auto config = Config::fromEnvironment();
        setLogLevel(config.logLevel);
        registerBuiltinEngines(registry, config);
    });
    return registry;
}

// Binding for csrc/errors.h
inline void bindErrors(py::module& m) {
    py::register_exception<ValidationError>(m, "ValidationError",
                                            PyExc_ValueError);
    py::register_exception<NotFoundError>(m, "NotFoundError", PyExc_LookupError);
    py::register_exception<EngineError>(m, "EngineError", PyExc_RuntimeError);
    py::register_exception<IOError>(m, "IOError", PyExc_OSError);
}

// Binding for csrc/config.h
inline void bindConfig(py::module& m) {
    py::enum_<LogLevel>(m, "LogLevel")
        .value("Debug", LogLevel::Debug)
        .value("Info", LogLevel::Info)
        .value("Warn", LogLevel::Warn)
        .value("Off", LogLevel::Off);
    m.def("setLogLevel", setLogLevel, py::arg("level"));

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("fromEnvironment", &Config::fromEnvironment)
        .def_readwrite("modelsDir", &Config::modelsDir)
        .def_readwrite("defaultDevice", &Config::defaultDevice)
        .def_readwrite("pauseSeconds", &Config::pauseSeconds)
        .def_readwrite("defaultFilename", &Config::defaultFilename)
        .def_readwrite("logLevel", &Config::logLevel);
}

// Binding for csrc/canonical.h and csrc/params.h
inline void bindParams(py::module& m) {
    py::enum_<ParamType>(m, "ParamType")
        .value("Float", ParamType::Float)
        .value("Int", ParamType::Int)
        .value("String", ParamType::String)
        .value("Choice", ParamType::Choice);

    py::class_<CanonicalParameter>(m, "CanonicalParameter")
        .def_readonly("id", &CanonicalParameter::id)
        .def_readonly("label", &CanonicalParameter::label)
        .def_readonly("description", &CanonicalParameter::description)
        .def_readonly("type", &CanonicalParameter::type)
        .def_readonly("default", &CanonicalParameter::defaultValue)
        .def_readonly("minValue", &CanonicalParameter::minValue)
        .def_readonly("maxValue", &CanonicalParameter::maxValue);
    m.def(
        "resolveCanonical",
        [](std::optional<std::string> id) -> std::optional<CanonicalParameter> {
            auto const* c = resolveCanonical(id);
            if (c == nullptr) return std::nullopt;
            return *c;
        },
        py::arg("id"));

    py::class_<ParameterDescriptor>(m, "ParameterDescriptor")
        .def_readonly("id", &ParameterDescriptor::id)
        .def_readonly("label", &ParameterDescriptor::label)
        .def_readonly("type", &ParameterDescriptor::type)
        .def_readonly("default", &ParameterDescriptor::defaultValue)
        .def_readonly("required", &ParameterDescriptor::required)
        .def_readonly("description", &ParameterDescriptor::description)
        .def_readonly("options", &ParameterDescriptor::options)
        .def_readonly("minValue", &ParameterDescriptor::minValue)
        .def_readonly("maxValue", &ParameterDescriptor::maxValue)
        .def_readonly("canonical", &ParameterDescriptor::canonical)
        .def("display", &displayOf);

    py::class_<ParameterDisplay>(m, "ParameterDisplay")
        .def_readonly("label", &ParameterDisplay::label)
        .def_readonly("description", &ParameterDisplay::description)
        .def_readonly("minValue", &ParameterDisplay::minValue)
        .def_readonly("maxValue", &ParameterDisplay::maxValue);
}

// Binding for csrc/registry.h
inline void bindRegistry(py::module& m) {
    py::class_<EngineDescriptor>(m, "EngineDescriptor")
        .def_readonly("name", &EngineDescriptor::name)
        .def_readonly("displayName", &EngineDescriptor::displayName)
        .def_readonly("requiresVoiceFile", &EngineDescriptor::requiresVoiceFile)
        .def_readonly("chunkChars", &EngineDescriptor::chunkChars);

    py::class_<EngineRegistry, std::unique_ptr<EngineRegistry, py::nodelete>>(
        m, "EngineRegistry")
        .def("list", &EngineRegistry::list)
        .def("names", &EngineRegistry::names)
        .def("__contains__", &EngineRegistry::contains, py::arg("name"))
        .def("describe", &EngineRegistry::descriptor, py::arg("name"))
        .def("parameters", &EngineRegistry::parameters, py::arg("name"));
    m.def("defaultRegistry", &defaultRegistry,
          py::return_value_policy::reference);
}

// Binding for csrc/generate.h and csrc/text/chunker.h
inline void bindGenerate(py::module& m) {
    m.def(
        "chunkText",
        [](std::string_view text, size_t maxChars) {
            StringList chunks;
            for (auto& c : chunkText(text, maxChars)) {
                chunks.push_back(std::move(c.text));
            }
            return chunks;
        },
        py::arg("text"), py::arg("maxChars"));

    m.def(
        "generate",
        [](std::string text, std::optional<std::filesystem::path> voicePath,
           std::filesystem::path outputDir, std::string outputFilename,
           std::string engineName, std::string device, ParamMap parameters) {
            GenerationRequest request{std::move(text),       std::move(voicePath),
                                      std::move(outputDir),  std::move(outputFilename),
                                      std::move(engineName), std::move(device),
                                      std::move(parameters)};
            auto config = Config::fromEnvironment();
            return generate(defaultRegistry(), request, config);
        },
        py::arg("text"), py::arg("voicePath") = py::none(),
        py::arg("outputDir") = ".", py::arg("outputFilename") = "",
        py::arg("engineName") = "chatterbox", py::arg("device") = "",
        py::arg("parameters") = ParamMap{},
        py::call_guard<py::gil_scoped_release>());
}

}  // namespace narrate

PYBIND11_MODULE(narratexx_C, m) {
    m.doc() = "Narrate-XX Python Binding Module";
    narrate::bindErrors(m);
    narrate::bindConfig(m);
    narrate::bindParams(m);
    narrate::bindRegistry(m);
    narrate::bindGenerate(m);
}
