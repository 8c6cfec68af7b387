#pragma once
#include <nlohmann/json.hpp>

namespace sizegate
{

using Json = nlohmann::json;

} // namespace sizegate
