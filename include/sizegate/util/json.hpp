#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace sizegate::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }
inline std::string dump(const json& j) { return j.dump(); }

} // namespace sizegate::util::json
