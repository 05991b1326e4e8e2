/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file file_utils.hpp
 * @brief Utilities for file operations
 **/

#ifndef _FLEET_FILE_UTILS_HPP_
#define _FLEET_FILE_UTILS_HPP_

#include "fleet/expected.hpp"
#include "fleet/buffer.hpp"

#include <fstream>
#include <memory>
#include <string>

namespace fleet
{

/**
 * Returns the amount of data left in the given file.
 */
Expected<size_t> get_istream_size(std::ifstream &s);

/**
 * Reads full file content into a string. Returns FLEET_NOT_FOUND if the file does not exist.
 */
Expected<std::string> read_text_file(const std::string &file_path);

/**
 * Random access reader over a local file. Not thread safe - every thread should own its reader.
 */
class FileReader final
{
public:
    static Expected<std::unique_ptr<FileReader>> create(const std::string &file_path);

    FileReader(const std::string &file_path);
    FileReader(const FileReader &) = delete;
    FileReader &operator=(const FileReader &) = delete;

    fleet_status open();
    bool is_open() const;
    fleet_status close();

    /**
     * Reads exactly @a size bytes starting at @a offset. Returns FLEET_FILE_READ_FAILURE if the file ended before
     * @a size bytes could be read (the file shrank or was truncated).
     */
    fleet_status read_from_offset(uint64_t offset, MemoryView dst, size_t size);

    /**
     * Reads up to dst.size() bytes from the current position, returns the amount read (0 at end of file).
     */
    Expected<size_t> read_some(MemoryView dst);

    Expected<size_t> get_size();

    const std::string &path() const { return m_file_path; }

private:
    std::ifstream m_fstream;
    std::string m_file_path;
};

} /* namespace fleet */

#endif /* _FLEET_FILE_UTILS_HPP_ */
