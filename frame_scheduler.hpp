#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace bloch {

using FrameHandle   = std::uint64_t;
using FrameCallback = std::function<void(double timestamp_ms)>;

// "Run once when next free to render."
struct IFrameScheduler {
    virtual ~IFrameScheduler() = default;
    virtual FrameHandle request_frame(FrameCallback cb) = 0;
    virtual void cancel_frame(FrameHandle handle) = 0;
};

// Single-threaded queue flushed once per display refresh by the owner's loop.
class FrameQueue : public IFrameScheduler {
public:
    FrameHandle request_frame(FrameCallback cb) override {
        const FrameHandle h = ++last_handle_;
        pending_.emplace(h, std::move(cb));
        return h;
    }

    void cancel_frame(FrameHandle handle) override { pending_.erase(handle); }

    // Runs everything requested before this call, oldest first. Requests made
    // from inside a callback wait for the next dispatch.
    void dispatch(double now_ms) {
        const FrameHandle horizon = last_handle_;
        std::vector<FrameHandle> due;
        due.reserve(pending_.size());
        for (const auto& kv : pending_) {
            if (kv.first > horizon) break;
            due.push_back(kv.first);
        }
        for (FrameHandle h : due) {
            auto it = pending_.find(h);
            if (it == pending_.end()) continue;   // cancelled by an earlier callback
            FrameCallback cb = std::move(it->second);
            pending_.erase(it);
            cb(now_ms);
        }
    }

    std::size_t pending() const { return pending_.size(); }

private:
    std::map<FrameHandle, FrameCallback> pending_;
    FrameHandle last_handle_ = 0;
};

}
