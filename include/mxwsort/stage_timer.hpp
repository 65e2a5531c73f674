#pragma once

#include "types.hpp"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace mxwsort {

/**
 * @brief Wall-clock time spent in each pipeline stage of one well
 *
 * Entries keep the order in which stages finished.
 */
class StageTimings {
public:
    void record(std::string stage, Duration elapsed) {
        entries_.emplace_back(std::move(stage), elapsed);
    }

    const std::vector<std::pair<std::string, Duration>>& entries() const { return entries_; }

    Duration total() const {
        Duration sum{0};
        for (const auto& entry : entries_) {
            sum += entry.second;
        }
        return sum;
    }

    /// "open=1.2ms export=830.4ms ..." in recording order
    std::string format() const {
        std::ostringstream ss;
        ss.setf(std::ios::fixed);
        ss.precision(1);
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (i) ss << ' ';
            ss << entries_[i].first << '=' << to_milliseconds(entries_[i].second) << "ms";
        }
        return ss.str();
    }

    void reset() { entries_.clear(); }

private:
    std::vector<std::pair<std::string, Duration>> entries_;
};

/**
 * @brief RAII scope timer recording into StageTimings on destruction
 *
 * Records on every exit path, so a stage that throws still shows up.
 */
class StageTimer {
public:
    StageTimer(StageTimings& timings, std::string stage)
        : timings_(timings), stage_(std::move(stage)), start_(Clock::now()) {}

    ~StageTimer() {
        timings_.record(std::move(stage_), Clock::now() - start_);
    }

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

private:
    StageTimings& timings_;
    std::string stage_;
    Timestamp start_;
};

#define MXWSORT_CONCAT_IMPL(a, b) a##b
#define MXWSORT_CONCAT(a, b) MXWSORT_CONCAT_IMPL(a, b)

/**
 * @brief Time the rest of the enclosing scope as one named stage
 */
#define MXWSORT_TIMED_STAGE(timings, stage) \
    ::mxwsort::StageTimer MXWSORT_CONCAT(_stage_timer_, __LINE__)(timings, stage)

}  // namespace mxwsort
