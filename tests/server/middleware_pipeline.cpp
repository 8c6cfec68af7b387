/// @file middleware_pipeline.cpp
/// @brief Tests for the handler chain and the request/response context

#include "sizegate/exceptions.hpp"
#include "sizegate/server/middleware_pipeline.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sizegate;
using namespace sizegate::server;

class RecordingMiddleware : public Middleware
{
  public:
    RecordingMiddleware(std::string name, std::vector<std::string>& log)
        : name_(std::move(name)), log_(log)
    {
    }

    void operator()(HttpContext& ctx, const Next& next) override
    {
        log_.push_back(name_ + ":before");
        next();
        log_.push_back(name_ + ":after");
        (void)ctx;
    }

  private:
    std::string name_;
    std::vector<std::string>& log_;
};

void test_empty_pipeline()
{
    std::cout << "  test_empty_pipeline... " << std::flush;

    MiddlewarePipeline pipeline;
    assert(pipeline.empty());

    HttpContext ctx;
    int calls = 0;
    pipeline.execute(ctx, [&calls](HttpContext&) { ++calls; });
    assert(calls == 1);

    // A null final handler is allowed
    pipeline.execute(ctx, nullptr);

    std::cout << "OK\n";
}

void test_execution_order()
{
    std::cout << "  test_execution_order... " << std::flush;

    std::vector<std::string> log;
    MiddlewarePipeline pipeline;
    auto& same = pipeline.use(std::make_shared<RecordingMiddleware>("first", log))
                     .use(std::make_shared<RecordingMiddleware>("second", log));
    assert(&same == &pipeline);
    assert(pipeline.size() == 2);

    HttpContext ctx;
    pipeline.execute(ctx, [&log](HttpContext&) { log.push_back("handler"); });

    std::vector<std::string> expected = {"first:before", "second:before", "handler",
                                         "second:after", "first:after"};
    assert(log == expected);

    std::cout << "OK\n";
}

void test_short_circuit()
{
    std::cout << "  test_short_circuit... " << std::flush;

    std::vector<std::string> log;
    MiddlewarePipeline pipeline;
    pipeline
        .use(
            [](HttpContext& ctx, const Next&)
            {
                ctx.response.set_status(403);
                ctx.response.complete();
            })
        .use(std::make_shared<RecordingMiddleware>("never", log));

    HttpContext ctx;
    bool handler_called = false;
    pipeline.execute(ctx, [&handler_called](HttpContext&) { handler_called = true; });
    assert(!handler_called);
    assert(log.empty());
    assert(ctx.response.status() == 403);

    std::cout << "OK\n";
}

void test_exception_propagates_through_chain()
{
    std::cout << "  test_exception_propagates_through_chain... " << std::flush;

    std::vector<std::string> log;
    MiddlewarePipeline pipeline;
    pipeline.use(std::make_shared<RecordingMiddleware>("outer", log));

    HttpContext ctx;
    bool caught = false;
    try
    {
        pipeline.execute(ctx, [](HttpContext&) { throw std::runtime_error("boom"); });
    }
    catch (const std::runtime_error& e)
    {
        caught = std::string(e.what()) == "boom";
    }
    assert(caught);
    assert(log.size() == 1);
    assert(log[0] == "outer:before");

    std::cout << "OK\n";
}

void test_headers_case_insensitive()
{
    std::cout << "  test_headers_case_insensitive... " << std::flush;

    Request req;
    req.headers["Content-Type"] = "application/json";
    assert(req.header("content-type").value() == "application/json");
    assert(req.header("CONTENT-TYPE").value() == "application/json");
    assert(!req.header("Content-Length").has_value());

    std::cout << "OK\n";
}

void test_parse_content_length()
{
    std::cout << "  test_parse_content_length... " << std::flush;

    assert(parse_content_length("0").value() == 0);
    assert(parse_content_length("71").value() == 71);
    assert(parse_content_length("9223372036854775807").value() ==
           std::numeric_limits<int64_t>::max());
    assert(!parse_content_length("9223372036854775808"));
    assert(!parse_content_length(""));
    assert(!parse_content_length("-1"));
    assert(!parse_content_length("+5"));
    assert(!parse_content_length("12a"));
    assert(!parse_content_length(" 12"));

    std::cout << "OK\n";
}

void test_body_read_lazily()
{
    std::cout << "  test_body_read_lazily... " << std::flush;

    Request req;
    int reads = 0;
    req.set_body_reader(
        [&reads]()
        {
            ++reads;
            return std::string("payload");
        });
    assert(!req.body_read());
    assert(reads == 0);
    assert(req.body() == "payload");
    assert(req.body() == "payload");
    assert(reads == 1);
    assert(req.body_read());

    Request empty;
    assert(empty.body().empty());

    std::cout << "OK\n";
}

void test_response_completion()
{
    std::cout << "  test_response_completion... " << std::flush;

    Response res;
    assert(res.status() == 200);
    res.write_json(Json{{"ok", true}});
    assert(res.content_type() == "application/json");
    assert(Json::parse(res.body())["ok"] == true);
    res.set_header("X-Test", "1");
    res.complete();

    bool threw_status = false;
    try
    {
        res.set_status(500);
    }
    catch (const Error&)
    {
        threw_status = true;
    }
    bool threw_header = false;
    try
    {
        res.set_header("X-Late", "1");
    }
    catch (const Error&)
    {
        threw_header = true;
    }
    assert(threw_status);
    assert(threw_header);
    assert(res.status() == 200);
    assert(res.headers().size() == 1);

    std::cout << "OK\n";
}

int main()
{
    std::cout << "Middleware Pipeline Tests\n";
    std::cout << "=========================\n";

    try
    {
        test_empty_pipeline();
        test_execution_order();
        test_short_circuit();
        test_exception_propagates_through_chain();
        test_headers_case_insensitive();
        test_parse_content_length();
        test_body_read_lazily();
        test_response_completion();

        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}
