/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file upload_progress.cpp
 * @brief Show upload progress
 **/
#include "upload_progress.hpp"
#include "common.hpp"
#include "common/os_utils.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>

static std::string stage_to_string(PipelineStage stage)
{
    switch (stage) {
    case PipelineStage::PLANNING:
        return "Hashing content";
    case PipelineStage::CREATING:
        return "Preparing binary";
    case PipelineStage::UPLOADING:
        return "Uploading parts";
    case PipelineStage::FINALIZING:
        return "Finalizing upload";
    case PipelineStage::VERIFYING:
        return "Waiting for remote hash verification";
    case PipelineStage::SIGNING:
        return "Signing binary";
    case PipelineStage::DONE:
        return "Done";
    default:
        return "Unknown stage";
    }
}

Expected<std::shared_ptr<UploadProgress>> UploadProgress::create(std::chrono::milliseconds print_interval)
{
    TRY(auto stop_event, Event::create_shared(Event::State::not_signalled));

    auto progress = make_shared_nothrow<UploadProgress>(print_interval, stop_event, OsUtils::is_stderr_terminal());
    CHECK_NOT_NULL_AS_EXPECTED(progress, FLEET_OUT_OF_HOST_MEMORY);
    return progress;
}

UploadProgress::UploadProgress(std::chrono::milliseconds print_interval, EventPtr stop_event, bool is_terminal) :
    m_print_interval(print_interval),
    m_stop_event(stop_event),
    m_is_terminal(is_terminal),
    m_total_bytes(0),
    m_confirmed_bytes(0),
    m_resumed_bytes(0),
    m_parts_to_upload(0),
    m_parts_uploaded(0),
    m_retries(0),
    m_start(std::chrono::steady_clock::now())
{}

UploadProgress::~UploadProgress()
{
    finish();
}

void UploadProgress::on_stage(PipelineStage stage)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    std::cerr << stage_to_string(stage) << "..." << std::endl;
}

void UploadProgress::on_upload_started(uint64_t total_bytes, uint64_t confirmed_bytes, uint32_t parts_to_upload)
{
    m_total_bytes = total_bytes;
    m_confirmed_bytes = confirmed_bytes;
    m_resumed_bytes = confirmed_bytes;
    m_parts_to_upload = parts_to_upload;
    m_parts_uploaded = 0;
    m_retries = 0;
    m_start = std::chrono::steady_clock::now();

    if (0 < confirmed_bytes) {
        std::unique_lock<std::mutex> lock(m_mutex);
        std::cerr << "Resuming, " << CliCommon::bytes_to_string(confirmed_bytes) << " already uploaded" << std::endl;
    }
    if (m_is_terminal && (0 < parts_to_upload)) {
        start();
    }
}

void UploadProgress::on_part_confirmed(const PartProgress &progress)
{
    m_confirmed_bytes += progress.bytes;
    ++m_parts_uploaded;
}

void UploadProgress::on_part_retry(uint32_t /*index*/, uint32_t /*attempt*/, fleet_status /*status*/)
{
    ++m_retries;
}

void UploadProgress::on_upload_finished(fleet_status status)
{
    finish();

    std::unique_lock<std::mutex> lock(m_mutex);
    if (FLEET_SUCCESS == status) {
        std::cerr << get_progress_text() << std::endl;
    } else {
        std::cerr << "Upload stopped after " << m_parts_uploaded.load() << "/" << m_parts_to_upload.load() <<
            " parts, status " << status << std::endl;
    }
}

void UploadProgress::start()
{
    m_print_thread = std::thread([this] () {
        OsUtils::set_current_thread_name("fleet-progress");
        while (true) {
            print_progress(true);
            auto status = m_stop_event->wait(m_print_interval);
            if (FLEET_TIMEOUT != status) {
                break;
            }
        }
    });
}

void UploadProgress::finish()
{
    if (m_print_thread.joinable()) {
        auto status = m_stop_event->signal();
        if (FLEET_SUCCESS != status) {
            LOGGER__ERROR("Failed stopping the progress printer, status {}", status);
        }
        m_print_thread.join();
        if (FLEET_SUCCESS != m_stop_event->reset()) {
            LOGGER__WARNING("Failed resetting the progress printer stop event");
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        std::cerr << FORMAT_CLEAR_LINE << std::flush;
    }
}

void UploadProgress::print_progress(bool should_clear_line)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (should_clear_line) {
        std::cerr << FORMAT_CLEAR_LINE;
    }
    std::cerr << get_progress_text() << std::flush;
}

std::string UploadProgress::get_progress_text()
{
    const auto total_bytes = m_total_bytes.load();
    const auto confirmed_bytes = m_confirmed_bytes.load();
    const auto uploaded_bytes = confirmed_bytes - m_resumed_bytes.load();
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_start).count();
    const auto rate = (0 < elapsed) ? (static_cast<double>(uploaded_bytes) / elapsed) : 0.0;
    const auto percent = (0 < total_bytes) ? ((100 * confirmed_bytes) / total_bytes) : 100;

    std::stringstream res;
    res << "Uploaded " << percent << "% | " << CliCommon::bytes_to_string(confirmed_bytes) << "/" <<
        CliCommon::bytes_to_string(total_bytes) << " | " << m_parts_uploaded.load() << "/" <<
        m_parts_to_upload.load() << " parts | " << CliCommon::bytes_to_string(static_cast<uint64_t>(rate)) <<
        "/s | " << CliCommon::duration_to_string(std::chrono::seconds(static_cast<int64_t>(elapsed)));
    if (0 < m_retries.load()) {
        res << " | " << m_retries.load() << " retries";
    }
    return res.str();
}
