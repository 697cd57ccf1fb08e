#pragma once
#include <mutex>
#include <condition_variable>
#include <cstdint>

/**
 * @brief 排号锁: 按到达顺序授予锁
 *
 * 满足 BasicLockable, 可配合 std::lock_guard / std::unique_lock 使用。
 */
class FifoMutex {
public:
    FifoMutex() = default;
    FifoMutex(const FifoMutex&) = delete;
    FifoMutex& operator=(const FifoMutex&) = delete;

    void lock() {
        std::unique_lock<std::mutex> lk(mtx);
        const uint64_t ticket = nextTicket++;
        cv.wait(lk, [&] { return nowServing == ticket; });
    }

    void unlock() {
        {
            std::lock_guard<std::mutex> lk(mtx);
            ++nowServing;
        }
        cv.notify_all();
    }

private:
    std::mutex mtx;
    std::condition_variable cv;
    uint64_t nextTicket = 0;
    uint64_t nowServing = 0;
};
