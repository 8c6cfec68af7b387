#pragma once
/// @file middleware_pipeline.hpp
/// @brief Ordered HTTP handler chain
///
/// Provides composable middleware with:
/// - Middleware base class invoked with the request context and a continuation
/// - MiddlewarePipeline that links middleware in registration order ahead of a final handler

#include "sizegate/server/http_context.hpp"

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace sizegate::server
{

/// Continuation: runs the rest of the chain
using Next = std::function<void()>;

/// Terminal application handler
using RequestHandler = std::function<void(HttpContext&)>;

/// Function form of a middleware
using MiddlewareFn = std::function<void(HttpContext&, const Next&)>;

/// Base middleware class. An implementation either handles the request itself or calls
/// `next()` to hand it to the following link.
class Middleware
{
  public:
    virtual ~Middleware() = default;

    virtual void operator()(HttpContext& ctx, const Next& next) = 0;
};

/// Adapts a MiddlewareFn to the Middleware interface
class FunctionMiddleware : public Middleware
{
  public:
    explicit FunctionMiddleware(MiddlewareFn fn) : fn_(std::move(fn)) {}

    void operator()(HttpContext& ctx, const Next& next) override
    {
        fn_(ctx, next);
    }

  private:
    MiddlewareFn fn_;
};

/// Chain builder and executor
///
/// Usage:
/// ```cpp
/// MiddlewarePipeline pipeline;
/// pipeline.use(std::make_shared<MyMiddleware>())
///         .use([](HttpContext& ctx, const Next& next) { next(); });
/// pipeline.execute(ctx, app_handler);
/// ```
class MiddlewarePipeline
{
  public:
    /// Add middleware to the pipeline (executed in order added)
    MiddlewarePipeline& use(std::shared_ptr<Middleware> mw)
    {
        middleware_.push_back(std::move(mw));
        return *this;
    }

    MiddlewarePipeline& use(MiddlewareFn fn)
    {
        return use(std::make_shared<FunctionMiddleware>(std::move(fn)));
    }

    /// Execute the pipeline with a final handler
    void execute(HttpContext& ctx, RequestHandler final_handler) const
    {
        // Build chain in reverse order so first-added executes first
        Next chain = [&ctx, handler = std::move(final_handler)]()
        {
            if (handler)
                handler(ctx);
        };

        for (auto it = middleware_.rbegin(); it != middleware_.rend(); ++it)
        {
            auto& mw = *it;
            chain = [mw, &ctx, next = std::move(chain)]() { (*mw)(ctx, next); };
        }

        chain();
    }

    bool empty() const
    {
        return middleware_.empty();
    }
    size_t size() const
    {
        return middleware_.size();
    }

  private:
    std::vector<std::shared_ptr<Middleware>> middleware_;
};

} // namespace sizegate::server
