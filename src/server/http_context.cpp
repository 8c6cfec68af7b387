#include "sizegate/server/http_context.hpp"

#include "sizegate/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace sizegate::server
{

bool HeaderNameLess::operator()(const std::string& a, const std::string& b) const
{
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](unsigned char x, unsigned char y)
                                        { return std::tolower(x) < std::tolower(y); });
}

std::optional<int64_t> parse_content_length(const std::string& value)
{
    if (value.empty())
        return std::nullopt;

    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    int64_t result = 0;
    for (char c : value)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        int digit = c - '0';
        if (result > (max - digit) / 10)
            return std::nullopt;
        result = result * 10 + digit;
    }
    return result;
}

std::optional<std::string> Request::header(const std::string& name) const
{
    auto it = headers.find(name);
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

const std::string& Request::body()
{
    if (!body_)
    {
        if (reader_)
            body_ = reader_();
        else
            body_ = std::string();
        reader_ = nullptr;
    }
    return *body_;
}

void Response::ensure_writable() const
{
    if (completed_)
        throw Error("response already completed");
}

void Response::set_status(int status)
{
    ensure_writable();
    status_ = status;
}

void Response::set_header(const std::string& name, const std::string& value)
{
    ensure_writable();
    headers_[name] = value;
}

void Response::set_content(std::string body, std::string content_type)
{
    ensure_writable();
    body_ = std::move(body);
    content_type_ = std::move(content_type);
    has_content_ = true;
}

void Response::write_json(const Json& j)
{
    set_content(j.dump(), JSON_CONTENT_TYPE);
}

} // namespace sizegate::server
