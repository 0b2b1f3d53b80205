#include "status/status_publisher.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace neoforge::status {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

std::string snapshot_to_json(const ProgressSnapshot& snapshot) {
    nlohmann::json payload;
    payload["agent"] = snapshot.agent;
    payload["task"] = snapshot.task;
    payload["logs"] = snapshot.logs;
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

StatusPublisher::StatusPublisher(const ProgressSink& sink, std::filesystem::path output_file,
                                 const std::chrono::milliseconds interval,
                                 const std::size_t log_lines)
    : sink_(sink),
      output_file_(std::move(output_file)),
      interval_(interval),
      log_lines_(log_lines) {}

StatusPublisher::~StatusPublisher() { stop(); }

void StatusPublisher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stopping_ = false;
    worker_ = std::thread(&StatusPublisher::loop, this);
    LOG_INFO("StatusPublisher: writing status to " + output_file_.string());
}

void StatusPublisher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();
    worker_.join();

    auto written = publish_once();
    if (core::errors::is_error(written)) {
        LOG_WARN("StatusPublisher: final snapshot not written: " +
                 core::errors::get_error(written).message);
    }
}

core::errors::Result<std::filesystem::path> StatusPublisher::publish_once() const {
    const std::string body = snapshot_to_json(sink_.snapshot(log_lines_));
    std::filesystem::path temp_file = output_file_;
    temp_file += ".tmp";

    {
        std::ofstream out(temp_file, std::ios::trunc);
        if (!out.is_open()) {
            return ForgeError{ErrorCategory::Execution,
                              "Unable to open status file: " + temp_file.string(),
                              "status_write_failed"};
        }
        out << body << "\n";
        if (!out.good()) {
            return ForgeError{ErrorCategory::Execution,
                              "Unable to write status file: " + temp_file.string(),
                              "status_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_file, output_file_, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Execution,
                          "Unable to publish status file: " + ec.message(),
                          "status_write_failed"};
    }
    return output_file_;
}

void StatusPublisher::loop() {
    bool reported_failure = false;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        lock.unlock();
        auto written = publish_once();
        if (core::errors::is_error(written) && !reported_failure) {
            LOG_WARN("StatusPublisher: " + core::errors::get_error(written).message);
            reported_failure = true;
        }
        lock.lock();
        wake_.wait_for(lock, interval_, [this] { return stopping_; });
    }
}

}  // namespace neoforge::status
