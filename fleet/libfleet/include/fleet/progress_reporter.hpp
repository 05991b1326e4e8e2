/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file progress_reporter.hpp
 * @brief Sink for upload progress events.
 **/

#ifndef _FLEET_PROGRESS_REPORTER_HPP_
#define _FLEET_PROGRESS_REPORTER_HPP_

#include "fleet/fleet.h"

#include <chrono>
#include <cstdint>

/** fleet namespace */
namespace fleet
{

enum class PipelineStage {
    PLANNING,
    CREATING,
    UPLOADING,
    FINALIZING,
    VERIFYING,
    SIGNING,
    DONE,
};

struct PartProgress {
    uint32_t index;
    uint64_t bytes;
    // Time spent on the part, retries included
    std::chrono::milliseconds elapsed;
};

/**
 * Observer of pipeline events. Events are fire-and-forget: implementations must return quickly and must be safe to
 * call from several upload workers at once.
 */
class FLEETAPI ProgressReporter
{
public:
    virtual ~ProgressReporter() = default;

    virtual void on_stage(PipelineStage stage) = 0;
    virtual void on_upload_started(uint64_t total_bytes, uint64_t confirmed_bytes, uint32_t parts_to_upload) = 0;
    virtual void on_part_confirmed(const PartProgress &progress) = 0;
    virtual void on_part_retry(uint32_t index, uint32_t attempt, fleet_status status) = 0;
    virtual void on_upload_finished(fleet_status status) = 0;
};

class FLEETAPI NullProgressReporter final : public ProgressReporter
{
public:
    virtual void on_stage(PipelineStage) override {}
    virtual void on_upload_started(uint64_t, uint64_t, uint32_t) override {}
    virtual void on_part_confirmed(const PartProgress &) override {}
    virtual void on_part_retry(uint32_t, uint32_t, fleet_status) override {}
    virtual void on_upload_finished(fleet_status) override {}
};

} /* namespace fleet */

#endif /* _FLEET_PROGRESS_REPORTER_HPP_ */
