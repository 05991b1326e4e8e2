/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file filesystem.cpp
 * @brief Filesystem wrapper for Linux
 **/

#include "common/filesystem.hpp"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/file.h>
#include <pwd.h>

namespace fleet
{

const char *Filesystem::SEPARATOR = "/";
static const std::string UNIQUE_TMP_FILE_SUFFIX = ".tmp.XXXXXX";

Expected<Filesystem::DirWalker> Filesystem::DirWalker::create(const std::string &dir_path)
{
    DIR *dir = opendir(dir_path.c_str());
    CHECK(nullptr != dir, make_unexpected(FLEET_FILE_OPERATION_FAILURE),
        "Could not open directory \"{}\" with errno {}", dir_path, errno);
    return DirWalker(dir, dir_path);
}

Filesystem::DirWalker::DirWalker(DIR *dir, const std::string &dir_path) :
    m_dir(dir),
    m_path_string(dir_path)
{}

Filesystem::DirWalker::~DirWalker()
{
    if (nullptr != m_dir) {
        const auto result = closedir(m_dir);
        if (-1 == result) {
            LOGGER__ERROR("closedir on directory \"{}\" failed with errno {}", m_path_string.c_str(), errno);
        }
    }
}

Filesystem::DirWalker::DirWalker(DirWalker &&other) :
    m_dir(std::exchange(other.m_dir, nullptr)),
    m_path_string(other.m_path_string)
{}

dirent* Filesystem::DirWalker::next_file()
{
    return readdir(m_dir);
}

Expected<std::vector<std::string>> Filesystem::get_files_in_dir_flat(const std::string &dir_path)
{
    const std::string dir_path_with_sep = has_suffix(dir_path, SEPARATOR) ? dir_path : dir_path + SEPARATOR;

    TRY(auto dir, DirWalker::create(dir_path_with_sep));

    std::vector<std::string> files;
    struct dirent *entry = nullptr;
    while ((entry = dir.next_file()) != nullptr) {
        if (entry->d_type != DT_REG) {
            continue;
        }
        const std::string file_name = entry->d_name;
        files.emplace_back(dir_path_with_sep + file_name);
    }

    return files;
}

Expected<size_t> Filesystem::get_file_size(const std::string &file_path)
{
    struct stat attr{};
    auto res = stat(file_path.c_str(), &attr);
    if ((0 != res) && (ENOENT == errno)) {
        return make_unexpected(FLEET_NOT_FOUND);
    }
    CHECK(0 == res, FLEET_FILE_OPERATION_FAILURE, "stat() failed on file {}, with errno {}", file_path, errno);
    CHECK(S_ISREG(attr.st_mode), FLEET_FILE_OPERATION_FAILURE, "{} is not a regular file", file_path);

    return static_cast<size_t>(attr.st_size);
}

Expected<bool> Filesystem::is_directory(const std::string &path)
{
    struct stat path_stat{};
    auto ret_Val = stat(path.c_str(), &path_stat);
    if (ret_Val != 0 && (errno == ENOENT)) {
        // Directory path does not exist
        return false;
    }
    CHECK(0 == ret_Val, make_unexpected(FLEET_FILE_OPERATION_FAILURE),
        "stat() on path \"{}\" failed. errno {}", path.c_str(), errno);

   return S_ISDIR(path_stat.st_mode);
}

fleet_status Filesystem::create_directory(const std::string &dir_path)
{
    auto ret_val = mkdir(dir_path.c_str(), S_IRWXU);
    CHECK((ret_val == 0) || (errno == EEXIST), FLEET_FILE_OPERATION_FAILURE,
        "Failed to create directory {} with errno {}", dir_path, errno);
    return FLEET_SUCCESS;
}

fleet_status Filesystem::create_directories(const std::string &dir_path)
{
    size_t position = 0;
    while (std::string::npos != position) {
        position = dir_path.find(SEPARATOR, position + 1);
        const auto current = dir_path.substr(0, position);
        if (current.empty()) {
            continue;
        }
        auto status = create_directory(current);
        CHECK_SUCCESS(status);
    }

    TRY(const auto is_dir, is_directory(dir_path));
    CHECK(is_dir, FLEET_FILE_OPERATION_FAILURE, "{} exists and is not a directory", dir_path);
    return FLEET_SUCCESS;
}

fleet_status Filesystem::remove_file(const std::string &file_path)
{
    auto ret_val = unlink(file_path.c_str());
    if ((0 != ret_val) && (ENOENT == errno)) {
        return FLEET_NOT_FOUND;
    }
    CHECK(0 == ret_val, FLEET_FILE_OPERATION_FAILURE, "Failed to remove file {} with errno {}", file_path, errno);
    return FLEET_SUCCESS;
}

std::string Filesystem::get_home_directory()
{
    const char *homedir = getenv("HOME");
    if (NULL == homedir) {
        homedir = getpwuid(getuid())->pw_dir;
    }

    return homedir;
}

bool Filesystem::does_file_exists(const std::string &path)
{
    // From https://stackoverflow.com/a/12774387
    struct stat buffer;
    return (0 == stat(path.c_str(), &buffer));
}

static fleet_status write_all(int fd, const std::string &content, const std::string &file_path)
{
    size_t written = 0;
    while (written < content.size()) {
        auto res = write(fd, content.data() + written, content.size() - written);
        if ((-1 == res) && (EINTR == errno)) {
            continue;
        }
        CHECK(-1 != res, FLEET_FILE_OPERATION_FAILURE, "Failed writing {} with errno {}", file_path, errno);
        written += static_cast<size_t>(res);
    }
    return FLEET_SUCCESS;
}

fleet_status Filesystem::write_file_atomically(const std::string &file_path, const std::string &content)
{
    std::string tmp_path = file_path + UNIQUE_TMP_FILE_SUFFIX;
    std::vector<char> tmp_name(tmp_path.begin(), tmp_path.end());
    tmp_name.push_back('\0');

    int fd = mkstemp(tmp_name.data());
    CHECK(-1 != fd, FLEET_FILE_OPERATION_FAILURE, "Failed to create tmp file {}, with errno {}", tmp_path, errno);
    tmp_path = tmp_name.data();

    auto status = write_all(fd, content, tmp_path);
    if ((FLEET_SUCCESS == status) && (0 != fsync(fd))) {
        LOGGER__ERROR("fsync on {} failed with errno {}", tmp_path, errno);
        status = FLEET_FILE_OPERATION_FAILURE;
    }
    if ((0 != close(fd)) && (FLEET_SUCCESS == status)) {
        LOGGER__ERROR("close on {} failed with errno {}", tmp_path, errno);
        status = FLEET_FILE_OPERATION_FAILURE;
    }
    if ((FLEET_SUCCESS == status) && (0 != rename(tmp_path.c_str(), file_path.c_str()))) {
        LOGGER__ERROR("Failed renaming {} to {} with errno {}", tmp_path, file_path, errno);
        status = FLEET_FILE_OPERATION_FAILURE;
    }
    if (FLEET_SUCCESS != status) {
        unlink(tmp_path.c_str());
        return status;
    }

    // The rename is durable only once the directory entry is flushed
    const auto dir_path = dirname(file_path);
    int dir_fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (-1 != dir_fd) {
        if (0 != fsync(dir_fd)) {
            LOGGER__WARNING("fsync on directory {} failed with errno {}", dir_path, errno);
        }
        close(dir_fd);
    }

    return FLEET_SUCCESS;
}

Expected<LockedFile> LockedFile::create(const std::string &file_path, const std::string &mode)
{
    auto fp = fopen(file_path.c_str(), mode.c_str());
    CHECK_AS_EXPECTED((nullptr != fp), FLEET_OPEN_FILE_FAILURE, "Failed opening file: {}, with errno: {}", file_path, errno);

    int fd = fileno(fp);
    int done = flock(fd, LOCK_EX | LOCK_NB);
    if (-1 == done) {
        const auto flock_errno = errno;
        fclose(fp);
        CHECK(EWOULDBLOCK != flock_errno, FLEET_INVALID_OPERATION,
            "File {} is locked by another process", file_path);
        LOGGER__ERROR("Failed to flock file: {}, with errno: {}", file_path, flock_errno);
        return make_unexpected(FLEET_FILE_OPERATION_FAILURE);
    }

    return LockedFile(fp, fd);
}

LockedFile::LockedFile(FILE *fp, int fd) : m_fp(fp), m_fd(fd)
{}

LockedFile::~LockedFile()
{
    if (m_fp != nullptr) {
        // The lock is released when all descriptors are closed.
        fclose(m_fp);
    }
}

LockedFile::LockedFile(LockedFile &&other) :
    m_fp(std::exchange(other.m_fp, nullptr)),
    m_fd(other.m_fd)
{}

int LockedFile::get_fd() const
{
    return m_fd;
}

} /* namespace fleet */
