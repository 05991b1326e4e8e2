/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file content_chunker.cpp
 * @brief Content chunker implementation
 **/

#include "fleet/content_chunker.hpp"

#include "common/utils.hpp"
#include "common/file_utils.hpp"
#include "common/filesystem.hpp"

#include "crypto/sha256.hpp"

namespace fleet
{

const size_t ContentChunker::READ_BLOCK_SIZE;

// Rounds up without overflowing for part sizes close to UINT64_MAX
static uint64_t count_parts(uint64_t total_size, uint64_t part_size)
{
    return (total_size / part_size) + ((0 != (total_size % part_size)) ? 1 : 0);
}

/*
 * Streams [offset, offset + length) through @a part_sha and, when given, @a whole_sha.
 * When @a dst is given the bytes are also copied there, so the caller must provide at least @a length bytes.
 */
static fleet_status stream_range(FileReader &reader, uint64_t offset, uint64_t length, Buffer &block,
    Sha256 &part_sha, Sha256 *whole_sha, uint8_t *dst)
{
    uint64_t done = 0;
    while (done < length) {
        const auto chunk_size = static_cast<size_t>(std::min<uint64_t>(block.size(), length - done));
        auto status = reader.read_from_offset(offset + done, MemoryView(block), chunk_size);
        CHECK_SUCCESS(status, "Failed reading {} bytes at offset {} of {}", chunk_size, offset + done, reader.path());

        CHECK_SUCCESS(part_sha.update(block.data(), chunk_size));
        if (nullptr != whole_sha) {
            CHECK_SUCCESS(whole_sha->update(block.data(), chunk_size));
        }
        if (nullptr != dst) {
            std::memcpy(dst + done, block.data(), chunk_size);
        }
        done += chunk_size;
    }
    return FLEET_SUCCESS;
}

static fleet_status validate_unchanged_size(const std::string &content_path, uint64_t expected_size)
{
    auto current_size = Filesystem::get_file_size(content_path);
    CHECK(current_size, FLEET_FILE_READ_FAILURE, "Content file {} disappeared while being read", content_path);
    CHECK(expected_size == current_size.value(), FLEET_FILE_READ_FAILURE,
        "Content file {} changed size while being read (expected {}, now {})", content_path, expected_size,
        current_size.value());
    return FLEET_SUCCESS;
}

class PartSequence::Impl final
{
public:
    Impl(const ContentChunker &chunker, std::unique_ptr<FileReader> &&reader, Buffer &&block, Sha256 &&part_sha,
        Sha256 &&whole_sha) :
        m_content_path(chunker.content_path()),
        m_total_size(chunker.total_size()),
        m_part_size(chunker.part_size()),
        m_parts_count(chunker.parts_count()),
        m_reader(std::move(reader)),
        m_block(std::move(block)),
        m_part_sha(std::move(part_sha)),
        m_whole_sha(std::move(whole_sha)),
        m_next_index(0)
    {}

    std::string m_content_path;
    uint64_t m_total_size;
    uint64_t m_part_size;
    uint32_t m_parts_count;
    std::unique_ptr<FileReader> m_reader;
    Buffer m_block;
    Sha256 m_part_sha;
    Sha256 m_whole_sha;
    uint32_t m_next_index;
    std::string m_content_hash;
};

PartSequence::PartSequence(std::unique_ptr<Impl> impl) :
    m_impl(std::move(impl))
{}

PartSequence::PartSequence(PartSequence &&other) = default;
PartSequence::~PartSequence() = default;

bool PartSequence::has_next() const
{
    return m_impl->m_next_index < m_impl->m_parts_count;
}

Expected<PartInfo> PartSequence::next()
{
    CHECK_AS_EXPECTED(has_next(), FLEET_INVALID_OPERATION, "No more parts in {}", m_impl->m_content_path);

    PartInfo part{};
    part.index = m_impl->m_next_index;
    part.offset = static_cast<uint64_t>(part.index) * m_impl->m_part_size;
    part.length = std::min(m_impl->m_part_size, m_impl->m_total_size - part.offset);

    CHECK_SUCCESS_AS_EXPECTED(m_impl->m_part_sha.reset());
    auto status = stream_range(*m_impl->m_reader, part.offset, part.length, m_impl->m_block, m_impl->m_part_sha,
        &m_impl->m_whole_sha, nullptr);
    CHECK_SUCCESS_AS_EXPECTED(status);
    TRY(const auto part_digest, m_impl->m_part_sha.finalize());
    part.hash = Sha256::to_hex(part_digest);

    m_impl->m_next_index++;
    if (!has_next()) {
        CHECK_SUCCESS_AS_EXPECTED(validate_unchanged_size(m_impl->m_content_path, m_impl->m_total_size));
        TRY(const auto whole_digest, m_impl->m_whole_sha.finalize());
        m_impl->m_content_hash = Sha256::to_hex(whole_digest);
    }

    return part;
}

fleet_status PartSequence::restart()
{
    CHECK_SUCCESS(m_impl->m_whole_sha.reset());
    m_impl->m_next_index = 0;
    m_impl->m_content_hash.clear();
    return FLEET_SUCCESS;
}

Expected<std::string> PartSequence::content_hash() const
{
    CHECK_AS_EXPECTED(!m_impl->m_content_hash.empty(), FLEET_INVALID_OPERATION,
        "Content hash is available only after every part was read");
    return Expected<std::string>(m_impl->m_content_hash);
}

ContentChunker::ContentChunker(const std::string &content_path, uint64_t total_size, uint64_t part_size) :
    m_content_path(content_path),
    m_total_size(total_size),
    m_part_size(part_size)
{}

Expected<ContentChunker> ContentChunker::create(const std::string &content_path, uint64_t part_size)
{
    CHECK_AS_EXPECTED(0 < part_size, FLEET_INVALID_ARGUMENT, "Part size must be positive");
    auto file_size = Filesystem::get_file_size(content_path);
    CHECK_AS_EXPECTED(FLEET_NOT_FOUND != file_size.status(), FLEET_FILE_READ_FAILURE,
        "Content file {} does not exist", content_path);
    CHECK_EXPECTED(file_size, "Failed reading size of {}", content_path);
    const uint64_t total_size = file_size.value();
    CHECK_AS_EXPECTED(0 < total_size, FLEET_INVALID_ARGUMENT, "Content file {} is empty", content_path);

    const auto parts_count = count_parts(total_size, part_size);
    CHECK_AS_EXPECTED(parts_count <= UINT32_MAX, FLEET_INVALID_ARGUMENT,
        "Part size {} is too small for content of {} bytes", part_size, total_size);

    return ContentChunker(content_path, total_size, part_size);
}

uint32_t ContentChunker::parts_count() const
{
    return static_cast<uint32_t>(count_parts(m_total_size, m_part_size));
}

Expected<PartInfo> ContentChunker::part_range(uint32_t index) const
{
    CHECK_AS_EXPECTED(index < parts_count(), FLEET_INVALID_ARGUMENT, "Part index {} out of range (parts count {})",
        index, parts_count());

    PartInfo part{};
    part.index = index;
    part.offset = static_cast<uint64_t>(index) * m_part_size;
    part.length = std::min(m_part_size, m_total_size - part.offset);
    return part;
}

Expected<PartSequence> ContentChunker::parts() const
{
    TRY(auto reader, FileReader::create(m_content_path));
    TRY(auto block, Buffer::create(static_cast<size_t>(std::min<uint64_t>(READ_BLOCK_SIZE, m_part_size))));
    TRY(auto part_sha, Sha256::create());
    TRY(auto whole_sha, Sha256::create());

    auto impl = make_unique_nothrow<PartSequence::Impl>(*this, std::move(reader), std::move(block),
        std::move(part_sha), std::move(whole_sha));
    CHECK_NOT_NULL_AS_EXPECTED(impl, FLEET_OUT_OF_HOST_MEMORY);
    return PartSequence(std::move(impl));
}

Expected<UploadPlan> ContentChunker::compute_plan() const
{
    TRY(auto sequence, parts());

    UploadPlan plan{};
    plan.content_path = m_content_path;
    plan.total_size = m_total_size;
    plan.part_size = m_part_size;
    plan.parts.reserve(parts_count());
    while (sequence.has_next()) {
        TRY(auto part, sequence.next());
        plan.parts.emplace_back(std::move(part));
    }
    TRY(plan.content_hash, sequence.content_hash());

    LOGGER__DEBUG("Planned {} parts of {} bytes for {} ({} bytes, sha256 {})", plan.parts_count(), m_part_size,
        m_content_path, m_total_size, plan.content_hash);
    return plan;
}

Expected<PartInfo> ContentChunker::hash_part(uint32_t index) const
{
    TRY(auto part, part_range(index));
    TRY(auto reader, FileReader::create(m_content_path));
    TRY(auto block, Buffer::create(static_cast<size_t>(std::min<uint64_t>(READ_BLOCK_SIZE, part.length))));
    TRY(auto part_sha, Sha256::create());

    CHECK_SUCCESS_AS_EXPECTED(stream_range(*reader, part.offset, part.length, block, part_sha, nullptr, nullptr));
    TRY(const auto digest, part_sha.finalize());
    part.hash = Sha256::to_hex(digest);
    return part;
}

Expected<PartContent> ContentChunker::read_part(uint32_t index) const
{
    TRY(auto part, part_range(index));
    TRY(auto reader, FileReader::create(m_content_path));
    TRY(auto block, Buffer::create(static_cast<size_t>(std::min<uint64_t>(READ_BLOCK_SIZE, part.length))));
    TRY(auto data, Buffer::create(static_cast<size_t>(part.length)));
    TRY(auto part_sha, Sha256::create());

    CHECK_SUCCESS_AS_EXPECTED(stream_range(*reader, part.offset, part.length, block, part_sha, nullptr, data.data()));
    TRY(const auto digest, part_sha.finalize());
    part.hash = Sha256::to_hex(digest);

    return PartContent{std::move(part), std::move(data)};
}

fleet_status ContentChunker::check_recorded_size(uint64_t recorded_size) const
{
    if (recorded_size != m_total_size) {
        LOGGER__WARNING("Size of {} is {} bytes, but {} bytes were recorded for it", m_content_path, m_total_size,
            recorded_size);
        return FLEET_SIZE_MISMATCH;
    }
    return FLEET_SUCCESS;
}

} /* namespace fleet */
