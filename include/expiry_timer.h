#pragma once
#ifndef EXPIRY_TIMER_H
#define EXPIRY_TIMER_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

/**
 * One-shot, re-armable timer backed by a dedicated worker thread.
 *
 * arm() replaces the pending deadline (earlier or later), cancel() clears it.
 * When the deadline passes the timer disarms itself and runs the task on the
 * worker thread with no internal lock held, so the task may re-arm the timer.
 * A task that is already running cannot be cancelled.
 *
 * The worker shares ownership of the timer state, so the timer may be stopped
 * and destroyed from inside its own task.
 */
class ExpiryTimer {
public:
    using clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    explicit ExpiryTimer(Task task);

    /**
     * Destructor - stops the worker thread, waiting for a running task.
     */
    ~ExpiryTimer();

    ExpiryTimer(const ExpiryTimer&) = delete;
    ExpiryTimer& operator=(const ExpiryTimer&) = delete;

    /// Fire once after delay. Replaces any pending deadline.
    void arm(clock::duration delay);

    /// Fire once at deadline. Replaces any pending deadline.
    void arm_at(clock::time_point deadline);

    /// Drop the pending deadline, if any.
    void cancel();

    /// Stop the worker thread. Further arm() calls are ignored.
    /// Called from inside the task, the worker is detached and exits once the
    /// task returns.
    void stop();

    bool armed() const;

    /// Pending deadline, empty when disarmed.
    std::optional<clock::time_point> deadline() const;

    /// Number of times the task has been run.
    size_t fired() const;

private:
    struct State {
        explicit State(Task t) : task(std::move(t)) {}

        Task task;
        std::mutex mutex;                 ///< Protects the fields below
        std::condition_variable cv;
        std::optional<clock::time_point> deadline;
        bool stopping{false};
        size_t fired{0};
    };

    static void run(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;      ///< Co-owned by the worker thread
    std::thread worker_;                ///< Started on first arm
};

#endif // EXPIRY_TIMER_H
