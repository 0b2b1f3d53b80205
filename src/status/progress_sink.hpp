#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace neoforge::status {

struct ProgressSnapshot {
    std::string agent;
    std::string task;
    std::vector<std::string> logs;  // oldest first
};

// Shared status record for external observers. One lock guards every read and
// write; callers never see the internal container.
class ProgressSink {
public:
    static constexpr std::size_t kDefaultCapacity = 50;

    explicit ProgressSink(std::size_t capacity = kDefaultCapacity);

    void update(const std::string& agent, const std::string& task,
                const std::optional<std::string>& log_line = std::nullopt);

    // The last max_lines log lines (all retained lines when 0).
    ProgressSnapshot snapshot(std::size_t max_lines = 0) const;

    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::string agent_ = "Idle";
    std::string task_ = "Waiting...";
    std::deque<std::string> logs_;
};

}  // namespace neoforge::status
