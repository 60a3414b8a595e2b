#include "expiry_timer.h"

ExpiryTimer::ExpiryTimer(Task task) : state_(std::make_shared<State>(std::move(task))) {}

ExpiryTimer::~ExpiryTimer(){
    stop();
}

void ExpiryTimer::arm(clock::duration delay){
    arm_at(clock::now() + delay);
}

void ExpiryTimer::arm_at(clock::time_point deadline){
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) return;
        state_->deadline = deadline;
        if (!worker_.joinable()) {
            worker_ = std::thread([state = state_]() { run(state); });
        }
    }
    state_->cv.notify_one();
}

void ExpiryTimer::cancel(){
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->deadline.reset();
    }
    state_->cv.notify_one();
}

void ExpiryTimer::stop(){
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        state_->deadline.reset();
    }
    state_->cv.notify_one();

    if (!worker_.joinable()) return;
    if (worker_.get_id() == std::this_thread::get_id()) {
        // Stopped from inside the task: the worker keeps state alive and
        // leaves its loop once the task returns
        worker_.detach();
    } else {
        worker_.join();
    }
}

bool ExpiryTimer::armed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline.has_value();
}

std::optional<ExpiryTimer::clock::time_point> ExpiryTimer::deadline() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

size_t ExpiryTimer::fired() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->fired;
}

// Worker loop: sleeps until the current deadline, which may move while waiting.
// Touches only the shared state, never the ExpiryTimer object.
void ExpiryTimer::run(const std::shared_ptr<State>& state){
    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->stopping) {
        if (!state->deadline) {
            state->cv.wait(lock, [&state]() { return state->stopping || state->deadline.has_value(); });
            continue;
        }

        auto when = *state->deadline;
        if (clock::now() < when) {
            state->cv.wait_until(lock, when);
            continue;   // re-check: deadline may have been moved or cleared
        }

        state->deadline.reset();
        ++state->fired;
        lock.unlock();
        state->task();
        lock.lock();
    }
}
