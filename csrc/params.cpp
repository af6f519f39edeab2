#include "params.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "errors.h"
#include "log.h"

namespace narrate {

ParameterDisplay displayOf(ParameterDescriptor const& p) {
    ParameterDisplay d{p.label, p.description, p.minValue, p.maxValue};
    auto const* c = p.canonical ? resolveCanonical(*p.canonical) : nullptr;
    if (c == nullptr) return d;
    d.label = c->label;
    d.description = c->description;
    if (c->minValue.has_value() or c->maxValue.has_value()) {
        d.minValue = c->minValue;
        d.maxValue = c->maxValue;
    }
    return d;
}

namespace {

[[noreturn]] void badType(ParameterDescriptor const& p, std::string_view got) {
    throw ValidationError(fmt::format("parameter '{}' expects a {} value, got {}",
                                      p.id, toString(p.type), got));
}

double parseDouble(ParameterDescriptor const& p, std::string const& s) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos == s.size()) return v;
    } catch (std::logic_error const&) {
    }
    badType(p, fmt::format("'{}'", s));
}

int64_t parseInt(ParameterDescriptor const& p, std::string const& s) {
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos == s.size()) return v;
    } catch (std::logic_error const&) {
    }
    badType(p, fmt::format("'{}'", s));
}

struct Coerce {
    ParameterDescriptor const& p;

    ParamValue operator()(bool v) const {
        if (p.type == ParamType::String) return std::string(v ? "true" : "false");
        badType(p, "a boolean");
    }

    ParamValue operator()(int64_t v) const {
        switch (p.type) {
            case ParamType::Float:
                return static_cast<double>(v);
            case ParamType::Int:
                return v;
            case ParamType::String:
                return fmt::format("{}", v);
            case ParamType::Choice:
                return choice(fmt::format("{}", v));
        }
        badType(p, "an integer");
    }

    ParamValue operator()(double v) const {
        switch (p.type) {
            case ParamType::Float:
                return v;
            case ParamType::Int:
                if (std::isfinite(v) and std::trunc(v) == v) {
                    return static_cast<int64_t>(v);
                }
                badType(p, fmt::format("{}", v));
            case ParamType::String:
                return fmt::format("{}", v);
            case ParamType::Choice:
                return choice(fmt::format("{}", v));
        }
        badType(p, "a number");
    }

    ParamValue operator()(std::string const& v) const {
        switch (p.type) {
            case ParamType::Float:
                return parseDouble(p, v);
            case ParamType::Int:
                return parseInt(p, v);
            case ParamType::String:
                return v;
            case ParamType::Choice:
                return choice(v);
        }
        badType(p, "a string");
    }

    ParamValue choice(std::string const& v) const {
        if (p.options.empty()) return v;
        auto it = std::find_if(p.options.begin(), p.options.end(),
                               [&](auto const& o) { return o.second == v; });
        if (it == p.options.end()) {
            StringList values;
            for (auto const& o : p.options) values.push_back(o.second);
            throw ValidationError(
                fmt::format("parameter '{}' must be one of [{}], got '{}'", p.id,
                            fmt::join(values, ", "), v));
        }
        return v;
    }
};

void checkRange(ParameterDescriptor const& p, ParamValue const& v) {
    double x;
    if (auto const* d = std::get_if<double>(&v)) {
        x = *d;
    } else if (auto const* i = std::get_if<int64_t>(&v)) {
        x = static_cast<double>(*i);
    } else {
        return;
    }
    auto range = displayOf(p);
    if ((range.minValue and x < *range.minValue) or
        (range.maxValue and x > *range.maxValue)) {
        throw ValidationError(fmt::format(
            "parameter '{}' = {} is out of range [{}, {}]", p.id, x,
            range.minValue ? fmt::format("{}", *range.minValue) : "-inf",
            range.maxValue ? fmt::format("{}", *range.maxValue) : "inf"));
    }
}

}  // namespace

ParamMap coerceParameters(ParameterList const& descriptors, ParamMap const& raw) {
    ParamMap result;
    for (auto const& p : descriptors) {
        auto it = raw.find(p.id);
        if (it == raw.end()) {
            if (p.required or not p.defaultValue.has_value()) {
                throw NotFoundError(
                    fmt::format("missing required parameter '{}'", p.id));
            }
            result.emplace(p.id, *p.defaultValue);
            continue;
        }
        auto value = std::visit(Coerce{p}, it->second);
        checkRange(p, value);
        result.emplace(p.id, std::move(value));
    }
    for (auto const& [key, value] : raw) {
        if (not result.contains(key)) {
            logDebug("ignoring undeclared parameter '{}'", key);
        }
    }
    return result;
}

}  // namespace narrate
