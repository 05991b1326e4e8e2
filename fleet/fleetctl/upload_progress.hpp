/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file upload_progress.hpp
 * @brief Show upload progress
 **/

#ifndef _FLEET_UPLOAD_PROGRESS_HPP_
#define _FLEET_UPLOAD_PROGRESS_HPP_

#include "fleetctl.hpp"

#include "fleet/progress_reporter.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>


/*
 * Prints upload progress to stderr, so that stdout carries only the command result. On a terminal a printer thread
 * refreshes a single status line; otherwise only stage changes and the final summary are printed.
 */
class UploadProgress final : public ProgressReporter {
public:
    static Expected<std::shared_ptr<UploadProgress>> create(std::chrono::milliseconds print_interval);

    UploadProgress(std::chrono::milliseconds print_interval, EventPtr stop_event, bool is_terminal);
    ~UploadProgress();

    virtual void on_stage(PipelineStage stage) override;
    virtual void on_upload_started(uint64_t total_bytes, uint64_t confirmed_bytes, uint32_t parts_to_upload) override;
    virtual void on_part_confirmed(const PartProgress &progress) override;
    virtual void on_part_retry(uint32_t index, uint32_t attempt, fleet_status status) override;
    virtual void on_upload_finished(fleet_status status) override;

private:
    void start();
    void finish();
    std::string get_progress_text();
    void print_progress(bool should_clear_line);

    const std::chrono::milliseconds m_print_interval;
    EventPtr m_stop_event;
    const bool m_is_terminal;
    std::thread m_print_thread;
    std::mutex m_mutex;

    std::atomic<uint64_t> m_total_bytes;
    std::atomic<uint64_t> m_confirmed_bytes;
    std::atomic<uint64_t> m_resumed_bytes;
    std::atomic<uint32_t> m_parts_to_upload;
    std::atomic<uint32_t> m_parts_uploaded;
    std::atomic<uint32_t> m_retries;
    std::chrono::time_point<std::chrono::steady_clock> m_start;
};

#endif /* _FLEET_UPLOAD_PROGRESS_HPP_ */
