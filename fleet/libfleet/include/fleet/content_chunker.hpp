/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file content_chunker.hpp
 * @brief Splits a local file into fixed size parts and computes per part and whole file SHA-256 hashes.
 **/

#ifndef _FLEET_CONTENT_CHUNKER_HPP_
#define _FLEET_CONTENT_CHUNKER_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/buffer.hpp"

#include <memory>
#include <string>
#include <vector>
#include <cstdint>

/** fleet namespace */
namespace fleet
{

/*! A contiguous byte range of the content. hash is the lowercase hex SHA-256 of the range. */
struct PartInfo {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
    std::string hash;
};

/*! A part together with its bytes, as read for upload */
struct PartContent {
    PartInfo info;
    Buffer data;
};

/*! Derived description of the content to upload */
struct UploadPlan {
    std::string content_path;
    uint64_t total_size = 0;
    uint64_t part_size = 0;
    // Ordered by index, indices are exactly 0..N-1
    std::vector<PartInfo> parts;
    // Lowercase hex SHA-256 of the whole content
    std::string content_hash;

    uint32_t parts_count() const { return static_cast<uint32_t>(parts.size()); }
};

class ContentChunker;

/**
 * Lazy, restartable pass over the content. Every call to next() streams exactly one part through SHA-256 while
 * accumulating the whole file hash, so no more than a small read block is held in memory.
 */
class FLEETAPI PartSequence final
{
public:
    ~PartSequence();
    PartSequence(PartSequence &&other);
    PartSequence(const PartSequence &) = delete;
    PartSequence &operator=(const PartSequence &) = delete;
    PartSequence &operator=(PartSequence &&) = delete;

    bool has_next() const;
    // Returns FLEET_FILE_READ_FAILURE if the content shrank or disappeared while being read
    Expected<PartInfo> next();
    // Starts over from the first part
    fleet_status restart();

    // Available once every part was consumed by next()
    Expected<std::string> content_hash() const;

private:
    class Impl;
    explicit PartSequence(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> m_impl;

    friend class ContentChunker;
};

class FLEETAPI ContentChunker final
{
public:
    static const size_t READ_BLOCK_SIZE = 64 * 1024;

    /**
     * Creates a chunker over @a content_path. The file size is sampled once here; later reads verify the file did
     * not change size underneath.
     */
    static Expected<ContentChunker> create(const std::string &content_path, uint64_t part_size);

    const std::string &content_path() const { return m_content_path; }
    uint64_t total_size() const { return m_total_size; }
    uint64_t part_size() const { return m_part_size; }
    uint32_t parts_count() const;

    // Byte range of part @a index, without a hash
    Expected<PartInfo> part_range(uint32_t index) const;

    Expected<PartSequence> parts() const;

    // Runs a full pass and returns the resulting plan
    Expected<UploadPlan> compute_plan() const;

    // Recomputes the hash of a single part independently of any other part
    Expected<PartInfo> hash_part(uint32_t index) const;

    // Reads part @a index and its hash in a single pass
    Expected<PartContent> read_part(uint32_t index) const;

    /**
     * Compares the current content size against a size recorded by an earlier plan for the same binary.
     * Returns FLEET_SIZE_MISMATCH when they differ. The caller decides what to do with the mismatch.
     */
    fleet_status check_recorded_size(uint64_t recorded_size) const;

private:
    ContentChunker(const std::string &content_path, uint64_t total_size, uint64_t part_size);

    std::string m_content_path;
    uint64_t m_total_size;
    uint64_t m_part_size;
};

} /* namespace fleet */

#endif /* _FLEET_CONTENT_CHUNKER_HPP_ */
