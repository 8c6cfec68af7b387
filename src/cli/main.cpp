#include "sizegate/exceptions.hpp"
#include "sizegate/logging.hpp"
#include "sizegate/server/http_server.hpp"
#include "sizegate/server/size_gate.hpp"
#include "sizegate/settings.hpp"
#include "sizegate/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace
{

std::atomic<bool> g_stop{false};

void on_signal(int)
{
    g_stop = true;
}

static int usage(int exit_code = 1)
{
    std::cout << "sizegate_server " << sizegate::VERSION_MAJOR << "." << sizegate::VERSION_MINOR
              << "." << sizegate::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  sizegate_server --help\n";
    std::cout << "  sizegate_server [--config <settings.json>]\n";
    std::cout << "\n";
    std::cout << "Without --config, settings are read from the environment:\n";
    std::cout << "  SIZEGATE_CONTENT_LENGTH_LIMIT  max declared Content-Length in bytes (<= 0 disables)\n";
    std::cout << "  SIZEGATE_LOG_LEVEL             DEBUG, INFO, WARN or ERROR\n";
    std::cout << "  SIZEGATE_HOST                  bind address (default 127.0.0.1)\n";
    std::cout << "  SIZEGATE_PORT                  listen port (default 18080)\n";
    std::cout << "  SIZEGATE_PAYLOAD_MAX_LENGTH    transport body cap in bytes (default 10485760)\n";
    return exit_code;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace sizegate;

    std::string config_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
            return usage(0);
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
            continue;
        }
        std::cerr << "Unknown argument: " << arg << "\n";
        return usage(1);
    }

    Settings settings;
    try
    {
        settings = config_path.empty() ? Settings::from_env() : Settings::from_file(config_path);
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }

    LoggerFactory loggers(settings.min_log_level());
    auto log = loggers.create("sizegate.server");

    auto limit = std::make_shared<const server::SizeLimitConfig>(
        server::SizeLimitConfig::from_settings(settings));

    auto pipeline = std::make_shared<server::MiddlewarePipeline>();
    server::use_size_gate(*pipeline, limit, loggers)
        .use(
            [log](server::HttpContext& ctx, const server::Next& next)
            {
                log.debug("{0} {1}", {ctx.request.method, ctx.request.path});
                next();
            });

    server::HttpServerWrapper http(
        pipeline,
        [](server::HttpContext& ctx)
        {
            const auto& body = ctx.request.body();
            ctx.response.write_json(Json{{"method", ctx.request.method},
                                         {"path", ctx.request.path},
                                         {"received_bytes", body.size()}});
        },
        settings.host, settings.port, settings.payload_max_length);

    if (!http.start())
    {
        log.error("Failed to listen on {0}:{1}", {settings.host, std::to_string(settings.port)});
        return 1;
    }

    if (limit->enabled())
        log.info("Listening on {0}:{1}, ContentLengthLimit={2}",
                 {http.host(), std::to_string(http.port()),
                  std::to_string(limit->max_content_length)});
    else
        log.info("Listening on {0}:{1}, content length check disabled",
                 {http.host(), std::to_string(http.port())});

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_stop && http.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    http.stop();
    log.info("Stopped");
    return 0;
}
