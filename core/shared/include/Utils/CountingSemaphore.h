// =============================================================================
// shared/include/Utils/CountingSemaphore.h
// 동시 모니터링 작업 수 제한용 세마포어와 RAII permit
// =============================================================================

#ifndef DEVICEWATCH_UTILS_COUNTING_SEMAPHORE_H
#define DEVICEWATCH_UTILS_COUNTING_SEMAPHORE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace DeviceWatch {
namespace Utils {

/**
 * @brief Counting semaphore built on mutex + condition_variable.
 */
class CountingSemaphore {
public:
    explicit CountingSemaphore(size_t permits) : available_(permits) {}

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return available_ > 0; });
        --available_;
    }

    bool tryAcquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ == 0) return false;
        --available_;
        return true;
    }

    // deadline까지 permit이 없으면 false
    template <typename Clock, typename Dur>
    bool tryAcquireUntil(const std::chrono::time_point<Clock, Dur>& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_until(lock, deadline, [this] { return available_ > 0; })) return false;
        --available_;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++available_;
        }
        cv_.notify_one();
    }

    size_t available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t available_;
};

/**
 * @brief 이미 획득한 permit을 소멸 시 반환한다.
 */
class SemaphorePermit {
public:
    SemaphorePermit() = default;
    explicit SemaphorePermit(CountingSemaphore& sem) : sem_(&sem) {}

    SemaphorePermit(const SemaphorePermit&) = delete;
    SemaphorePermit& operator=(const SemaphorePermit&) = delete;

    SemaphorePermit(SemaphorePermit&& other) noexcept : sem_(other.sem_) { other.sem_ = nullptr; }

    ~SemaphorePermit() {
        if (sem_) sem_->release();
    }

    bool held() const { return sem_ != nullptr; }

private:
    CountingSemaphore* sem_ = nullptr;
};

} // namespace Utils
} // namespace DeviceWatch

#endif // DEVICEWATCH_UTILS_COUNTING_SEMAPHORE_H
