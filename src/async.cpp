#include "filefuse/async.h"

#include <trantor/utils/Logger.h>

#include <exception>
#include <thread>

namespace filefuse {
namespace {

std::size_t resolveWorkers(std::size_t requested) {
    if (requested > 0) {
        return requested;
    }
    const auto hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 2;
}

}  // namespace

namespace detail {

void LogOperationException::operator()(std::exception_ptr error) const {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception &ex) {
        LOG_ERROR << "async operation threw: " << ex.what();
    } catch (...) {
        LOG_ERROR << "async operation threw a non-standard exception";
    }
}

}  // namespace detail

AsyncRunner::AsyncRunner(std::size_t workers) : workers_(resolveWorkers(workers)), pool_(workers_) {
    LOG_DEBUG << "async runner started with " << workers_ << " workers";
}

AsyncRunner::~AsyncRunner() {
    join();
}

std::future<SplitOutcome> AsyncRunner::split(SplitOptions options) {
    return submit(&filefuse::split, std::move(options));
}

std::future<VerifyOutcome> AsyncRunner::verify(CheckOptions options) {
    return submit(&filefuse::verify, std::move(options));
}

std::future<CheckOutcome> AsyncRunner::check(CheckOptions options) {
    return submit(&filefuse::check, std::move(options));
}

std::future<MergeOutcome> AsyncRunner::merge(MergeOptions options) {
    return submit(&filefuse::merge, std::move(options));
}

void AsyncRunner::join() {
    pool_.join();
}

}  // namespace filefuse
