#include "status/progress_sink.hpp"

namespace neoforge::status {

ProgressSink::ProgressSink(const std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ProgressSink::update(const std::string& agent, const std::string& task,
                          const std::optional<std::string>& log_line) {
    std::lock_guard<std::mutex> lock(mutex_);
    agent_ = agent;
    task_ = task;
    if (log_line.has_value() && !log_line->empty()) {
        logs_.push_back(log_line.value());
        while (logs_.size() > capacity_) {
            logs_.pop_front();
        }
    }
}

ProgressSnapshot ProgressSink::snapshot(const std::size_t max_lines) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProgressSnapshot snap;
    snap.agent = agent_;
    snap.task = task_;

    const std::size_t count =
        (max_lines == 0 || max_lines > logs_.size()) ? logs_.size() : max_lines;
    snap.logs.assign(logs_.end() - static_cast<std::ptrdiff_t>(count), logs_.end());
    return snap;
}

}  // namespace neoforge::status
