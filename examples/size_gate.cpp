#include "sizegate/server/size_gate.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace sizegate;

int main()
{
    server::MiddlewarePipeline pipeline;
    server::use_size_gate(pipeline,
                          std::make_shared<const server::SizeLimitConfig>(
                              server::SizeLimitConfig{10}),
                          LoggerFactory(LogLevel::Warning));

    auto app = [](server::HttpContext& ctx)
    { ctx.response.write_json(Json{{"received", ctx.request.body()}}); };

    for (int64_t declared : {int64_t{10}, int64_t{71}})
    {
        server::HttpContext ctx;
        ctx.request.method = "POST";
        ctx.request.path = "/upload";
        ctx.request.set_body(std::string(static_cast<size_t>(declared), 'x'));
        ctx.request.content_length = declared;

        pipeline.execute(ctx, app);
        std::cout << "Content-Length " << declared << " -> " << ctx.response.status() << " "
                  << ctx.response.body() << "\n";
    }
    return 0;
}
