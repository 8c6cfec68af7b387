#pragma once
#include "sizegate/server/middleware_pipeline.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
struct Request;
struct Response;
class ContentReader;
} // namespace httplib

namespace sizegate::server
{

class HttpServerWrapper
{
  public:
    /**
     * Construct an HTTP server that runs every request through a middleware pipeline.
     *
     * @param pipeline Chain executed ahead of `app` for every request
     * @param app Final application handler
     * @param host Host address to bind to (default: "127.0.0.1" for localhost)
     * @param port Port to listen on (default: 18080, 0 = pick a free port)
     * @param payload_max_length Transport-level hard cap on request bodies
     */
    HttpServerWrapper(std::shared_ptr<const MiddlewarePipeline> pipeline, RequestHandler app,
                      std::string host = "127.0.0.1", int port = 18080,
                      size_t payload_max_length = 10 * 1024 * 1024);
    ~HttpServerWrapper();

    /// Bind and start serving on a background thread.
    /// @return false if already running or the address cannot be bound
    bool start();
    void stop();
    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }

  private:
    void dispatch(const httplib::Request& req, httplib::Response& res,
                  const httplib::ContentReader* reader) const;

    std::shared_ptr<const MiddlewarePipeline> pipeline_;
    RequestHandler app_;
    std::string host_;
    int port_;
    size_t payload_max_length_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace sizegate::server
