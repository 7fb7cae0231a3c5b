#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace vault {
namespace common {

// 时钟接口, 所有与"当前时间"相关的比较都通过它完成, 便于测试注入
class Clock {
public:
    virtual ~Clock() = default;
    // 当前Unix时间戳（秒）
    virtual std::int64_t Now() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t Now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};

// 手动推进的时钟, 仅用于测试
class ManualClock : public Clock {
public:
    explicit ManualClock(std::int64_t start = 1700000000) : now_(start) {}

    std::int64_t Now() const override { return now_.load(); }
    void Set(std::int64_t now) { now_.store(now); }
    void Advance(std::int64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<std::int64_t> now_;
};

// 进程默认时钟
inline std::shared_ptr<Clock> DefaultClock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

}
}
