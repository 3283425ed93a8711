#pragma once

#include "filefuse/check.h"
#include "filefuse/merge.h"
#include "filefuse/split.h"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <utility>

namespace filefuse {

namespace detail {

// Default for the completion adapters: an operation that throws instead of
// returning an outcome is logged and its handler is not called.
struct LogOperationException {
    void operator()(std::exception_ptr error) const;
};

// One invocation is one job: the synchronous algorithm runs start to finish
// on whichever thread picks the job up, then the handler sees its result.
// An exception from the algorithm goes to `onError` and never reaches the
// executor's run loop.
template <typename Target, typename Outcome, typename Options, typename Handler, typename ErrorHandler>
void postOperation(Target &&target, Outcome (*operation)(const Options &), Options options, Handler &&handler,
                   ErrorHandler &&onError) {
    boost::asio::post(std::forward<Target>(target),
                      [operation, options = std::move(options), handler = std::forward<Handler>(handler),
                       onError = std::forward<ErrorHandler>(onError)]() mutable {
                          std::optional<Outcome> outcome;
                          try {
                              outcome.emplace(operation(options));
                          } catch (...) {
                              onError(std::current_exception());
                              return;
                          }
                          handler(std::move(*outcome));
                      });
}

}  // namespace detail

// Completion-handler adapters. `target` is an Asio executor or execution
// context: a thread_pool, or an io_context driven by a single thread for an
// event-loop deployment. The handler runs on a thread of that target.
// `onError` receives the std::exception_ptr of an operation that threw.
template <typename Target, typename Handler, typename ErrorHandler = detail::LogOperationException>
void asyncSplit(Target &&target, SplitOptions options, Handler &&handler, ErrorHandler &&onError = ErrorHandler{}) {
    detail::postOperation(std::forward<Target>(target), &split, std::move(options), std::forward<Handler>(handler),
                          std::forward<ErrorHandler>(onError));
}

template <typename Target, typename Handler, typename ErrorHandler = detail::LogOperationException>
void asyncVerify(Target &&target, CheckOptions options, Handler &&handler, ErrorHandler &&onError = ErrorHandler{}) {
    detail::postOperation(std::forward<Target>(target), &verify, std::move(options), std::forward<Handler>(handler),
                          std::forward<ErrorHandler>(onError));
}

template <typename Target, typename Handler, typename ErrorHandler = detail::LogOperationException>
void asyncCheck(Target &&target, CheckOptions options, Handler &&handler, ErrorHandler &&onError = ErrorHandler{}) {
    detail::postOperation(std::forward<Target>(target), &check, std::move(options), std::forward<Handler>(handler),
                          std::forward<ErrorHandler>(onError));
}

template <typename Target, typename Handler, typename ErrorHandler = detail::LogOperationException>
void asyncMerge(Target &&target, MergeOptions options, Handler &&handler, ErrorHandler &&onError = ErrorHandler{}) {
    detail::postOperation(std::forward<Target>(target), &merge, std::move(options), std::forward<Handler>(handler),
                          std::forward<ErrorHandler>(onError));
}

// Owns a thread pool and hands out futures. Independent invocations run in
// parallel; callers keep their output targets apart.
class AsyncRunner {
   public:
    explicit AsyncRunner(std::size_t workers = 0);
    ~AsyncRunner();

    AsyncRunner(const AsyncRunner &) = delete;
    AsyncRunner &operator=(const AsyncRunner &) = delete;

    std::future<SplitOutcome> split(SplitOptions options);
    std::future<VerifyOutcome> verify(CheckOptions options);
    std::future<CheckOutcome> check(CheckOptions options);
    std::future<MergeOutcome> merge(MergeOptions options);

    [[nodiscard]] boost::asio::thread_pool::executor_type executor() noexcept { return pool_.get_executor(); }
    [[nodiscard]] std::size_t workers() const noexcept { return workers_; }

    // Waits for every queued job; the runner accepts no work afterwards.
    void join();

    // Runs any `Outcome(const Options &)` operation on the pool. An exception
    // thrown by the operation is rethrown from the future's get().
    template <typename Outcome, typename Options>
    std::future<Outcome> submit(Outcome (*operation)(const Options &), Options options) {
        auto promise = std::make_shared<std::promise<Outcome>>();
        auto future = promise->get_future();
        detail::postOperation(
            pool_, operation, std::move(options),
            [promise](Outcome outcome) { promise->set_value(std::move(outcome)); },
            [promise](std::exception_ptr error) { promise->set_exception(error); });
        return future;
    }

   private:
    std::size_t workers_;
    boost::asio::thread_pool pool_;
};

}  // namespace filefuse
