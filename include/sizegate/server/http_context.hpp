#pragma once
#include "sizegate/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace sizegate::server
{

constexpr int STATUS_OK = 200;
constexpr int STATUS_BAD_REQUEST = 400;
constexpr int STATUS_PAYLOAD_TOO_LARGE = 413;
constexpr int STATUS_INTERNAL_SERVER_ERROR = 500;

constexpr const char* JSON_CONTENT_TYPE = "application/json";

struct HeaderNameLess
{
    bool operator()(const std::string& a, const std::string& b) const;
};

/// Header names compare case-insensitively
using Headers = std::map<std::string, std::string, HeaderNameLess>;

/// Parse a Content-Length header value (decimal digits only).
/// Returns std::nullopt when the value is empty, signed, not numeric or overflows int64_t.
std::optional<int64_t> parse_content_length(const std::string& value);

/// Read-only view of an incoming request.
///
/// The body is pulled through a reader the first time body() is called, so middleware that
/// never asks for it never causes it to be read from the connection.
struct Request
{
    using BodyReader = std::function<std::string()>;

    std::string method{"GET"};
    std::string path{"/"};
    Headers headers;
    /// Declared Content-Length; std::nullopt when the client sent none (e.g. chunked)
    std::optional<int64_t> content_length;

    std::optional<std::string> header(const std::string& name) const;

    void set_body(std::string body)
    {
        body_ = std::move(body);
        reader_ = nullptr;
    }
    void set_body_reader(BodyReader reader)
    {
        reader_ = std::move(reader);
        body_.reset();
    }

    /// Body contents; reads through the body reader on first use
    const std::string& body();

    bool body_read() const
    {
        return body_.has_value();
    }

  private:
    BodyReader reader_;
    std::optional<std::string> body_;
};

/// Response being built by the chain. Once complete() is called it refuses further writes.
class Response
{
  public:
    int status() const
    {
        return status_;
    }
    void set_status(int status);

    void set_header(const std::string& name, const std::string& value);
    const Headers& headers() const
    {
        return headers_;
    }

    void set_content(std::string body, std::string content_type);
    /// Serialize `j` as the body with content type application/json
    void write_json(const Json& j);

    const std::string& body() const
    {
        return body_;
    }
    const std::string& content_type() const
    {
        return content_type_;
    }
    bool has_content() const
    {
        return has_content_;
    }

    /// Mark the response finished; later writes throw sizegate::Error
    void complete()
    {
        completed_ = true;
    }
    bool completed() const
    {
        return completed_;
    }

  private:
    void ensure_writable() const;

    int status_{STATUS_OK};
    Headers headers_;
    std::string body_;
    std::string content_type_;
    bool has_content_{false};
    bool completed_{false};
};

struct HttpContext
{
    Request request;
    Response response;
};

} // namespace sizegate::server
