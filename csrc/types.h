#pragma once

#include <torch/torch.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace narrate {

using namespace std::literals;

// Pipeline Components:
struct Engine;
using EngineHandle = std::shared_ptr<Engine>;
using EngineFactory = std::function<EngineHandle()>;

// Data Types
using Tensor = torch::Tensor;
using IValue = torch::IValue;
using ParamValue = std::variant<bool, int64_t, double, std::string>;
using ParamMap = std::map<std::string, ParamValue>;

// List Types
using StringList = std::vector<std::string>;
using TensorList = std::vector<Tensor>;
using OptionList = std::vector<std::pair<std::string, std::string>>;
using EngineList = std::vector<std::pair<std::string, std::string>>;

}  // namespace narrate
