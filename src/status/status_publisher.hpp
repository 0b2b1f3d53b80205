#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include "core/errors/forge_errors.hpp"
#include "status/progress_sink.hpp"

namespace neoforge::status {

std::string snapshot_to_json(const ProgressSnapshot& snapshot);

// Background observer: every interval it takes a snapshot of the sink and
// writes it as JSON to a file (temp file + rename). It only reads the sink.
class StatusPublisher {
public:
    StatusPublisher(const ProgressSink& sink, std::filesystem::path output_file,
                    std::chrono::milliseconds interval = std::chrono::milliseconds(100),
                    std::size_t log_lines = 5);
    ~StatusPublisher();

    StatusPublisher(const StatusPublisher&) = delete;
    StatusPublisher& operator=(const StatusPublisher&) = delete;

    void start();
    // Writes one final snapshot and joins the thread. Safe to call twice.
    void stop();

    core::errors::Result<std::filesystem::path> publish_once() const;

private:
    void loop();

    const ProgressSink& sink_;
    std::filesystem::path output_file_;
    std::chrono::milliseconds interval_;
    std::size_t log_lines_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace neoforge::status
