#include "sizegate/settings.hpp"

#include "sizegate/exceptions.hpp"
#include "sizegate/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace sizegate
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int64_t parse_int(const std::string& key, const std::string& value)
{
    try
    {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size())
            throw ConfigError(key + ": trailing characters in '" + value + "'");
        return static_cast<int64_t>(parsed);
    }
    catch (const std::invalid_argument&)
    {
        throw ConfigError(key + ": not an integer: '" + value + "'");
    }
    catch (const std::out_of_range&)
    {
        throw ConfigError(key + ": out of range: '" + value + "'");
    }
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

/// Integer JSON value that fits int64_t; floats and oversized unsigned values are rejected
static int64_t json_int64(const Json& j, const std::string& key)
{
    const auto& v = j.at(key);
    if (!v.is_number_integer())
        throw ConfigError(key + ": expected an integer, got " + v.dump());
    if (v.is_number_unsigned() &&
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        throw ConfigError(key + ": out of range: " + v.dump());
    return v.get<int64_t>();
}

static size_t validate_payload_max_length(int64_t cap)
{
    if (cap <= 0)
        throw ConfigError("payload_max_length must be positive");
    return static_cast<size_t>(cap);
}

// The transport cap must never refuse a body the content length limit admits
static void raise_cap_to_limit(Settings& s)
{
    if (s.content_length_limit > 0 &&
        static_cast<uint64_t>(s.content_length_limit) > s.payload_max_length)
        s.payload_max_length = static_cast<size_t>(s.content_length_limit);
}

static int validate_port(int64_t port)
{
    if (port < 0 || port > 65535)
        throw ConfigError("port out of range: " + std::to_string(port));
    return static_cast<int>(port);
}

LogLevel Settings::min_log_level() const
{
    return log_level_from_string(log_level);
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = upper(getenv_str("SIZEGATE_LOG_LEVEL", s.log_level));
    log_level_from_string(lvl);
    s.log_level = lvl;

    if (const char* limit = std::getenv("SIZEGATE_CONTENT_LENGTH_LIMIT"))
        s.content_length_limit = parse_int("SIZEGATE_CONTENT_LENGTH_LIMIT", limit);
    s.host = getenv_str("SIZEGATE_HOST", s.host);
    if (const char* port = std::getenv("SIZEGATE_PORT"))
        s.port = validate_port(parse_int("SIZEGATE_PORT", port));
    if (const char* cap = std::getenv("SIZEGATE_PAYLOAD_MAX_LENGTH"))
        s.payload_max_length =
            validate_payload_max_length(parse_int("SIZEGATE_PAYLOAD_MAX_LENGTH", cap));
    raise_cap_to_limit(s);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    if (!j.is_object())
        throw ConfigError("settings must be a JSON object");

    Settings s;
    try
    {
        if (j.contains("log_level"))
        {
            auto lvl = upper(j.at("log_level").get<std::string>());
            log_level_from_string(lvl);
            s.log_level = lvl;
        }
        if (j.contains("ContentLengthLimit"))
            s.content_length_limit = json_int64(j, "ContentLengthLimit");
        if (j.contains("host"))
            s.host = j.at("host").get<std::string>();
        if (j.contains("port"))
            s.port = validate_port(json_int64(j, "port"));
        if (j.contains("payload_max_length"))
            s.payload_max_length =
                validate_payload_max_length(json_int64(j, "payload_max_length"));
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("invalid settings: ") + e.what());
    }
    raise_cap_to_limit(s);
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open settings file: " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();

    Json j;
    try
    {
        j = util::json::parse(buffer.str());
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("cannot parse settings file " + path + ": " + e.what());
    }
    return from_json(j);
}

} // namespace sizegate
