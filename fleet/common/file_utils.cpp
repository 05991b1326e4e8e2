/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file file_utils.cpp
 * @brief Utilities for file operations
 **/

#include "common/file_utils.hpp"
#include "common/filesystem.hpp"
#include "common/utils.hpp"

#include <limits>
#include <sstream>

namespace fleet
{

Expected<size_t> get_istream_size(std::ifstream &s)
{
    auto beg_pos = s.tellg();
    CHECK_AS_EXPECTED(-1 != beg_pos, FLEET_FILE_OPERATION_FAILURE, "ifstream::tellg() failed");

    s.seekg(0, s.end);
    CHECK_AS_EXPECTED(s.good(), FLEET_FILE_OPERATION_FAILURE, "ifstream::seekg() failed");

    auto size = s.tellg();
    CHECK_AS_EXPECTED(-1 != size, FLEET_FILE_OPERATION_FAILURE, "ifstream::tellg() failed");

    s.seekg(beg_pos, s.beg);
    CHECK_AS_EXPECTED(s.good(), FLEET_FILE_OPERATION_FAILURE, "ifstream::seekg() failed");

    return Expected<size_t>(static_cast<size_t>(size - beg_pos));
}

Expected<std::string> read_text_file(const std::string &file_path)
{
    if (!Filesystem::does_file_exists(file_path)) {
        return make_unexpected(FLEET_NOT_FOUND);
    }

    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    CHECK(file.good(), FLEET_OPEN_FILE_FAILURE, "Error opening file {} with errno {}", file_path, errno);

    std::stringstream content;
    content << file.rdbuf();
    CHECK(!file.bad(), FLEET_FILE_OPERATION_FAILURE, "Failed reading file {}", file_path);

    return content.str();
}

Expected<std::unique_ptr<FileReader>> FileReader::create(const std::string &file_path)
{
    auto reader = make_unique_nothrow<FileReader>(file_path);
    CHECK_NOT_NULL_AS_EXPECTED(reader, FLEET_OUT_OF_HOST_MEMORY);

    auto status = reader->open();
    CHECK_SUCCESS(status);

    return reader;
}

FileReader::FileReader(const std::string &file_path) : m_file_path(file_path) {}

fleet_status FileReader::open()
{
    m_fstream.open(m_file_path, std::ios::in | std::ios::binary);
    CHECK(m_fstream.good(), FLEET_OPEN_FILE_FAILURE, "Failed opening file, path: {}", m_file_path);
    return FLEET_SUCCESS;
}

bool FileReader::is_open() const
{
    return m_fstream.is_open();
}

fleet_status FileReader::close()
{
    m_fstream.close();
    return m_fstream.fail() ? FLEET_FILE_OPERATION_FAILURE : FLEET_SUCCESS;
}

fleet_status FileReader::read_from_offset(uint64_t offset, MemoryView dst, size_t size)
{
    CHECK(size <= dst.size(), FLEET_INVALID_ARGUMENT, "Read size {} exceeds destination size {}", size, dst.size());
    CHECK(m_fstream.is_open(), FLEET_INVALID_OPERATION, "File {} is not open", m_file_path);

    m_fstream.clear();
    (void)m_fstream.seekg(static_cast<std::streamoff>(offset), m_fstream.beg);
    CHECK(m_fstream.good(), FLEET_FILE_READ_FAILURE, "ifstream::seekg() to {} failed on {}", offset, m_file_path);

    (void)m_fstream.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(size));
    const auto read_bytes = static_cast<size_t>(m_fstream.gcount());
    CHECK(read_bytes == size, FLEET_FILE_READ_FAILURE,
        "Short read on {} at offset {} - expected {} bytes, got {}", m_file_path, offset, size, read_bytes);

    return FLEET_SUCCESS;
}

Expected<size_t> FileReader::read_some(MemoryView dst)
{
    CHECK(m_fstream.is_open(), FLEET_INVALID_OPERATION, "File {} is not open", m_file_path);

    (void)m_fstream.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(dst.size()));
    CHECK(!m_fstream.bad(), FLEET_FILE_READ_FAILURE, "ifstream::read() failed on {}", m_file_path);

    return static_cast<size_t>(m_fstream.gcount());
}

Expected<size_t> FileReader::get_size()
{
    CHECK(m_fstream.is_open(), FLEET_INVALID_OPERATION, "File {} is not open", m_file_path);
    m_fstream.clear();
    return get_istream_size(m_fstream);
}

} /* namespace fleet */
