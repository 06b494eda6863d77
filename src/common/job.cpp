#include "common/job.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

Job::Job() : state_(State::PENDING) {}

void Job::setState(State state) {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
        id = id_;
    }
    Logger::debug("Job '" + getName() + "' (run " + id + ") is " + stateToString(state));
}

void Job::setId(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    id_ = id;
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}

std::string Job::stateToString(State state) {
    switch (state) {
        case State::PENDING:
            return "pending";
        case State::RESOLVING_TARGETS:
            return "resolving targets";
        case State::INITIALIZING_BACKENDS:
            return "initializing backends";
        case State::RUNNING:
            return "running";
        case State::AGGREGATING:
            return "aggregating";
        case State::COMPLETED:
            return "completed";
        case State::FAILED:
            return "failed";
    }
    return "unknown";
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}
