/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file filesystem.hpp
 * @brief File system API
 **/

#ifndef _FLEET_OS_FILESYSTEM_HPP_
#define _FLEET_OS_FILESYSTEM_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"

#include <vector>
#include <string>
#include <cstdio>

#include <dirent.h>


namespace fleet
{

class Filesystem final {
public:
    Filesystem() = delete;

    static Expected<std::vector<std::string>> get_files_in_dir_flat(const std::string &dir_path);
    // Returns FLEET_NOT_FOUND when the file does not exist
    static Expected<size_t> get_file_size(const std::string &file_path);
    static Expected<bool> is_directory(const std::string &path);
    static fleet_status create_directory(const std::string &dir_path);
    // Creates every missing component of dir_path (like `mkdir -p`)
    static fleet_status create_directories(const std::string &dir_path);
    // Returns FLEET_NOT_FOUND when the file does not exist
    static fleet_status remove_file(const std::string &file_path);
    static std::string get_home_directory();
    static bool does_file_exists(const std::string &path);

    /**
     * Replaces the contents of @a file_path with @a content. The data is written to a temporary file in the same
     * directory, flushed to disk and renamed over @a file_path, so readers observe either the old or the new
     * contents and never a partial write.
     */
    static fleet_status write_file_atomically(const std::string &file_path, const std::string &content);

    static bool has_suffix(const std::string &file_name, const std::string &suffix)
    {
        return (file_name.size() >= suffix.size()) && equal(suffix.rbegin(), suffix.rend(), file_name.rbegin());
    }

    static std::string dirname(const std::string &file_name)
    {
        const auto last_separator_index = file_name.find_last_of(SEPARATOR);
        if (std::string::npos == last_separator_index) {
            return ".";
        }
        return file_name.substr(0, last_separator_index);
    }

    static std::string join(const std::string &dir_path, const std::string &name)
    {
        if (dir_path.empty()) {
            return name;
        }
        return has_suffix(dir_path, SEPARATOR) ? (dir_path + name) : (dir_path + SEPARATOR + name);
    }

private:
    // OS-specific filesystem directory separator char
    static const char *SEPARATOR;

    class DirWalker final {
    public:
        static Expected<DirWalker> create(const std::string &dir_path);
        ~DirWalker();
        DirWalker(const DirWalker &other) = delete;
        DirWalker &operator=(const DirWalker &other) = delete;
        DirWalker &operator=(DirWalker &&other) = delete;
        DirWalker(DirWalker &&other);

        dirent* next_file();

    private:
        DirWalker(DIR *dir, const std::string &dir_path);

        DIR *m_dir;
        const std::string m_path_string;
    };
};

class LockedFile {
public:
    // The mode param is the string containing the file access mode, compatible with `fopen` function.
    // Returns FLEET_INVALID_OPERATION when another process holds the lock.
    static Expected<LockedFile> create(const std::string &file_path, const std::string &mode);
    ~LockedFile();

    LockedFile(const LockedFile &other) = delete;
    LockedFile &operator=(const LockedFile &other) = delete;
    LockedFile &operator=(LockedFile &&other) = delete;
    LockedFile(LockedFile &&other);

    int get_fd() const;

private:
    LockedFile(FILE *fp, int fd);

    FILE *m_fp;
    int m_fd;
};

} /* namespace fleet */

#endif /* _FLEET_OS_FILESYSTEM_HPP_ */
