#pragma once

/// @file timer.h
/// @brief RAII wall-clock timer. Logs elapsed time on destruction.

#include <chrono>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace mbo {

/// RAII CPU timer on std::chrono::steady_clock.
///
/// Logs "<label>: <ms> ms" via spdlog on destruction unless constructed
/// with an empty label. The ADMM engine also polls it for its wall-clock
/// limit.
class CpuTimer {
public:
    explicit CpuTimer(std::string label = {})
        : label_(std::move(label)),
          start_(std::chrono::steady_clock::now()) {}

    ~CpuTimer() {
        if (!label_.empty()) {
            spdlog::info("{}: {:.3f} ms", label_, elapsed_ms());
        }
    }

    CpuTimer(const CpuTimer&) = delete;
    CpuTimer& operator=(const CpuTimer&) = delete;

    /// Elapsed time in milliseconds without stopping the timer.
    double elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(now - start_).count();
    }

    double elapsed_seconds() const { return elapsed_ms() * 1e-3; }

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace mbo
