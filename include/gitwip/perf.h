#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include "gitwip/logger.h"

namespace gitwip::perf {

class ScopedTimer {
public:
    explicit ScopedTimer(std::string label)
        : label_{std::move(label)}, start_{std::chrono::steady_clock::now()} {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_).count();
        Logger::instance().debug("{} took {} ms", label_, ms);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace gitwip::perf
