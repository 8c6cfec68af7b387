#pragma once
#include <stdexcept>
#include <string>

namespace sizegate
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Invalid or unreadable settings
struct ConfigError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

} // namespace sizegate
