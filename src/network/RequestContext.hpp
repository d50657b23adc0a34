#pragma once
#include <atomic>
#include <chrono>
#include <memory>

namespace ReadServe {

// Deadline and cancellation flag shared by every blocking step of one inbound request.
// Copies share the flag; WithTimeout derives a child that never outlives its parent.
class RequestContext {
public:
    using Clock = std::chrono::steady_clock;

    RequestContext();

    static RequestContext Timeout(std::chrono::milliseconds timeout);
    RequestContext WithTimeout(std::chrono::milliseconds timeout) const;

    Clock::time_point Deadline() const { return deadline_; }
    std::chrono::milliseconds Remaining() const;
    bool Expired() const;
    bool Cancelled() const;
    bool Done() const { return Cancelled() || Expired(); }

    void Cancel() const;

private:
    Clock::time_point deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}
