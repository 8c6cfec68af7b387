#pragma once
#include "sizegate/logging.hpp"
#include "sizegate/server/middleware_pipeline.hpp"
#include "sizegate/settings.hpp"
#include "sizegate/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sizegate::server
{

/// Single global request size limit
struct SizeLimitConfig
{
    /// Maximum declared Content-Length in bytes; 0 or negative disables the check
    int64_t max_content_length{0};

    bool enabled() const
    {
        return max_content_length > 0;
    }

    static SizeLimitConfig from_settings(const Settings& settings)
    {
        return SizeLimitConfig{settings.content_length_limit};
    }
};

/// Body of a 413 response
struct RejectionBody
{
    std::string title{"Request too large"};
    int status{STATUS_PAYLOAD_TOO_LARGE};
    std::string type{"https://tools.ietf.org/html/rfc7231#section-6.5.11"};
};

void to_json(Json& j, const RejectionBody& body);
void from_json(const Json& j, RejectionBody& body);

/// Rejects requests whose declared Content-Length exceeds the configured limit.
///
/// A rejected request gets a 413 JSON response, one warning log record and a completed
/// response; the rest of the chain is skipped. Every other request is handed to `next()`
/// unchanged. The body is never read: requests without a Content-Length header always pass.
///
/// Usage:
/// ```cpp
/// auto config = std::make_shared<const SizeLimitConfig>(SizeLimitConfig{1024 * 1024});
/// MiddlewarePipeline pipeline;
/// use_size_gate(pipeline, config, LoggerFactory(LogLevel::Warning));
/// ```
class SizeGate : public Middleware
{
  public:
    enum class Decision
    {
        Delegate,
        Reject
    };

    /// @param config Shared read-only limit; nullptr makes the gate a pass-through
    /// @param logger Sink for rejection warnings
    SizeGate(std::shared_ptr<const SizeLimitConfig> config, Logger logger);

    /// Pure decision for a declared content length
    Decision evaluate(const std::optional<int64_t>& declared_content_length) const;

    /// Reject or delegate. Exceptions thrown by `next` propagate unchanged.
    void check(HttpContext& ctx, const Next& next) const;

    void operator()(HttpContext& ctx, const Next& next) override
    {
        check(ctx, next);
    }

  private:
    void reject(HttpContext& ctx, int64_t declared_content_length) const;

    std::shared_ptr<const SizeLimitConfig> config_;
    Logger logger_;
};

/// Install a SizeGate at the current end of `builder`. Register it ahead of application
/// middleware so it runs first.
/// @return `builder`, for further chaining
MiddlewarePipeline& use_size_gate(MiddlewarePipeline& builder,
                                  std::shared_ptr<const SizeLimitConfig> config,
                                  const LoggerFactory& loggers);

} // namespace sizegate::server
