#include "sizegate/server/http_server.hpp"

#include "sizegate/exceptions.hpp"
#include "sizegate/types.hpp"
#include "sizegate/util/json.hpp"

#include <httplib.h>

namespace sizegate::server
{

HttpServerWrapper::HttpServerWrapper(std::shared_ptr<const MiddlewarePipeline> pipeline,
                                     RequestHandler app, std::string host, int port,
                                     size_t payload_max_length)
    : pipeline_(std::move(pipeline)), app_(std::move(app)), host_(std::move(host)), port_(port),
      payload_max_length_(payload_max_length)
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

static std::string error_body(const std::string& message)
{
    return util::json::dump(Json{{"error", message}});
}

void HttpServerWrapper::dispatch(const httplib::Request& req, httplib::Response& res,
                                 const httplib::ContentReader* reader) const
{
    HttpContext ctx;
    ctx.request.method = req.method;
    ctx.request.path = req.path;
    for (const auto& h : req.headers)
        ctx.request.headers[h.first] = h.second;

    if (req.has_header("Content-Length"))
    {
        ctx.request.content_length = parse_content_length(req.get_header_value("Content-Length"));
        if (!ctx.request.content_length)
        {
            res.status = STATUS_BAD_REQUEST;
            res.set_header("Connection", "close");
            res.set_content(error_body("Invalid Content-Length"), JSON_CONTENT_TYPE);
            return;
        }
    }

    // Body-carrying methods are routed with a content reader so the body stays on the
    // connection until a handler asks for it
    if (reader)
    {
        ctx.request.set_body_reader(
            [reader]()
            {
                std::string body;
                bool ok = (*reader)(
                    [&body](const char* data, size_t len)
                    {
                        body.append(data, len);
                        return true;
                    });
                if (!ok)
                    throw TransportError("failed to read request body");
                return body;
            });
    }
    else
    {
        ctx.request.set_body(req.body);
    }

    try
    {
        if (pipeline_)
            pipeline_->execute(ctx, app_);
        else if (app_)
            app_(ctx);
    }
    catch (const std::exception& e)
    {
        res.status = STATUS_INTERNAL_SERVER_ERROR;
        res.set_content(error_body(e.what()), JSON_CONTENT_TYPE);
        return;
    }

    res.status = ctx.response.status();
    for (const auto& h : ctx.response.headers())
        res.set_header(h.first, h.second);
    if (ctx.response.has_content())
        res.set_content(ctx.response.body(), ctx.response.content_type());

    // An unread body would be parsed as the next request on a kept-alive connection
    if (!ctx.request.body_read() && ctx.request.content_length.value_or(0) > 0)
        res.set_header("Connection", "close");
}

bool HttpServerWrapper::start()
{
    // Idempotent start: return false if already running
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    svr_->set_payload_max_length(payload_max_length_);
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    auto plain = [this](const httplib::Request& req, httplib::Response& res)
    { dispatch(req, res, nullptr); };
    auto with_reader = [this](const httplib::Request& req, httplib::Response& res,
                              const httplib::ContentReader& reader)
    { dispatch(req, res, &reader); };

    svr_->Get(R"(/(.*))", plain);
    svr_->Delete(R"(/(.*))", plain);
    svr_->Options(R"(/(.*))", plain);
    svr_->Post(R"(/(.*))", with_reader);
    svr_->Put(R"(/(.*))", with_reader);
    svr_->Patch(R"(/(.*))", with_reader);

    if (port_ == 0)
    {
        int bound = svr_->bind_to_any_port(host_);
        if (bound < 0)
        {
            svr_.reset();
            return false;
        }
        port_ = bound;
    }
    else if (!svr_->bind_to_port(host_, port_))
    {
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    svr_->wait_until_ready();
    return true;
}

void HttpServerWrapper::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
    svr_.reset();
}

} // namespace sizegate::server
