#pragma once

#include <chrono>
#include <memory>
#include <mutex>

namespace mockprom {

// Every "now" read in the engine goes through here.
class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;
    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::system_clock::now(); }
};

class ManualClock : public Clock {
public:
    explicit ManualClock(time_point start = std::chrono::system_clock::now()) : now_(start) {}
    time_point now() const override {
        std::lock_guard lock(mu_);
        return now_;
    }
    void advance(std::chrono::nanoseconds d) {
        std::lock_guard lock(mu_);
        now_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(d);
    }
    void set(time_point t) {
        std::lock_guard lock(mu_);
        now_ = t;
    }
private:
    mutable std::mutex mu_;
    time_point now_;
};

inline std::shared_ptr<Clock> make_system_clock() { return std::make_shared<SystemClock>(); }

}
