#include "logger.h"
#include "time_utils.h"

#include <chrono>

Logger::Logger(std::ostream& out, std::string prefix)
    : out_(out), prefix_(std::move(prefix)) {}

void Logger::log(const std::string& message) {
    auto stamp = format_local_time(std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << stamp << "] " << prefix_ << message << std::endl;
}

const std::string& Logger::prefix() const {
    return prefix_;
}

std::shared_ptr<Logger> make_stderr_logger(const std::string& prefix) {
    return std::make_shared<Logger>(std::cerr, prefix);
}
