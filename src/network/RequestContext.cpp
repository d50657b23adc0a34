#include "RequestContext.hpp"
#include <algorithm>

namespace ReadServe {

RequestContext::RequestContext()
    : deadline_(Clock::time_point::max()), cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

RequestContext RequestContext::Timeout(std::chrono::milliseconds timeout) {
    RequestContext ctx;
    ctx.deadline_ = Clock::now() + timeout;
    return ctx;
}

RequestContext RequestContext::WithTimeout(std::chrono::milliseconds timeout) const {
    RequestContext child = *this;
    child.deadline_ = std::min(deadline_, Clock::now() + timeout);
    return child;
}

std::chrono::milliseconds RequestContext::Remaining() const {
    if (deadline_ == Clock::time_point::max()) {
        return std::chrono::milliseconds::max();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

bool RequestContext::Expired() const {
    return Clock::now() >= deadline_;
}

bool RequestContext::Cancelled() const {
    return cancelled_->load(std::memory_order_acquire);
}

void RequestContext::Cancel() const {
    cancelled_->store(true, std::memory_order_release);
}

}
