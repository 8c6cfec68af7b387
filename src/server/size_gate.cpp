#include "sizegate/server/size_gate.hpp"

namespace sizegate::server
{

void to_json(Json& j, const RejectionBody& body)
{
    j = Json{{"title", body.title}, {"status", body.status}, {"type", body.type}};
}

void from_json(const Json& j, RejectionBody& body)
{
    j.at("title").get_to(body.title);
    j.at("status").get_to(body.status);
    j.at("type").get_to(body.type);
}

SizeGate::SizeGate(std::shared_ptr<const SizeLimitConfig> config, Logger logger)
    : config_(std::move(config)), logger_(std::move(logger))
{
}

SizeGate::Decision SizeGate::evaluate(const std::optional<int64_t>& declared_content_length) const
{
    if (!config_ || !config_->enabled())
        return Decision::Delegate;

    // Without a declared length (chunked transfer) there is nothing to compare
    if (!declared_content_length)
        return Decision::Delegate;

    if (*declared_content_length > config_->max_content_length)
        return Decision::Reject;
    return Decision::Delegate;
}

void SizeGate::check(HttpContext& ctx, const Next& next) const
{
    const auto& declared = ctx.request.content_length;
    if (evaluate(declared) == Decision::Reject)
    {
        reject(ctx, *declared);
        return;
    }
    next();
}

void SizeGate::reject(HttpContext& ctx, int64_t declared_content_length) const
{
    logger_.warning("Rejecting request with Content-Length {0} more than allowed {1}.",
                    {std::to_string(declared_content_length),
                     std::to_string(config_->max_content_length)});

    ctx.response.set_status(STATUS_PAYLOAD_TOO_LARGE);
    ctx.response.write_json(Json(RejectionBody{}));
    ctx.response.complete();
}

MiddlewarePipeline& use_size_gate(MiddlewarePipeline& builder,
                                  std::shared_ptr<const SizeLimitConfig> config,
                                  const LoggerFactory& loggers)
{
    return builder.use(
        std::make_shared<SizeGate>(std::move(config), loggers.create("sizegate.SizeGate")));
}

} // namespace sizegate::server
