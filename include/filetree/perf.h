#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "filetree/logger.h"

namespace filetree::perf {

class ScopedTimer {
public:
    explicit ScopedTimer(std::string label, Logger::Level level = Logger::Level::Debug)
        : label_{std::move(label)}, level_{level}, start_{std::chrono::steady_clock::now()} {}

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        Logger::instance().log(level_, "{} took {:.3f} ms", label_, static_cast<double>(us) / 1000.0);
    }

private:
    std::string label_;
    Logger::Level level_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace filetree::perf
