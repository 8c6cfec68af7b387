#pragma once
#include "sizegate/logging.hpp"
#include "sizegate/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace sizegate
{

struct Settings
{
    std::string log_level{"INFO"};
    /// Maximum declared Content-Length in bytes; 0 or negative disables the check
    int64_t content_length_limit{0};
    std::string host{"127.0.0.1"};
    int port{18080};
    /// Hard cap applied by the HTTP transport itself. from_env/from_json raise it to
    /// content_length_limit when the limit is larger.
    size_t payload_max_length{10 * 1024 * 1024};

    LogLevel min_log_level() const;

    /// Read SIZEGATE_* environment variables over the defaults.
    /// @throws ConfigError on malformed values
    static Settings from_env();
    /// @throws ConfigError on malformed values or wrong JSON types
    static Settings from_json(const Json& j);
    /// @throws ConfigError if the file cannot be read or parsed
    static Settings from_file(const std::string& path);
};

} // namespace sizegate
