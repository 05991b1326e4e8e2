/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_utils.hpp
 * @brief Scratch directories and content files for the unit tests
 **/

#ifndef _FLEET_TEST_UTILS_HPP_
#define _FLEET_TEST_UTILS_HPP_

#include "fleet/fleet.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fleet
{
namespace test
{

class TempDirectory final
{
public:
    TempDirectory()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "fleet_tests_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        const char *created = mkdtemp(buffer.data());
        EXPECT_NE(nullptr, created);
        m_path = (nullptr != created) ? std::string(created) : pattern;
    }

    ~TempDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;

    const std::string &path() const { return m_path; }

    std::string file(const std::string &name) const
    {
        return (std::filesystem::path(m_path) / name).string();
    }

private:
    std::string m_path;
};

// Deterministic, non repeating content of @a size bytes
inline std::vector<uint8_t> make_content(size_t size, uint32_t seed = 1)
{
    std::vector<uint8_t> content(size);
    uint32_t state = seed;
    for (auto &byte : content) {
        state = (state * 1103515245u) + 12345u;
        byte = static_cast<uint8_t>(state >> 16);
    }
    return content;
}

inline void write_file(const std::string &path, const std::vector<uint8_t> &content)
{
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    ASSERT_TRUE(file.good()) << "Failed writing " << path;
}

inline void write_text_file(const std::string &path, const std::string &content)
{
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    file << content;
    ASSERT_TRUE(file.good()) << "Failed writing " << path;
}

inline std::string read_text(const std::string &path)
{
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} /* namespace test */
} /* namespace fleet */

#endif /* _FLEET_TEST_UTILS_HPP_ */
