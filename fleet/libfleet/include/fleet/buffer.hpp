/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file buffer.hpp
 * @brief Buffer helper class
 **/

#ifndef _FLEET_BUFFER_HPP_
#define _FLEET_BUFFER_HPP_

#include "fleet/expected.hpp"

#include <memory>
#include <vector>
#include <string>
#include <cstdint>

/** fleet namespace */
namespace fleet
{

class Buffer;
class MemoryView;
using BufferPtr = std::shared_ptr<Buffer>;

/*! Owning heap buffer. Copying is explicit through Buffer::copy(). */
class FLEETAPI Buffer final
{
public:
    Buffer();

    static Expected<Buffer> create(size_t size);
    static Expected<Buffer> create(size_t size, uint8_t default_value);
    static Expected<Buffer> create(const uint8_t *src, size_t size);
    static Expected<BufferPtr> create_shared(size_t size);

    Expected<Buffer> copy() const;

    Buffer(const Buffer& other) = delete;
    Buffer& operator=(const Buffer& other) = delete;
    Buffer(Buffer&& other) = default;
    Buffer& operator=(Buffer&& other) = default;
    ~Buffer() = default;

    bool operator==(const Buffer& rhs) const;
    bool operator!=(const Buffer& rhs) const;

    uint8_t* data() noexcept;
    const uint8_t* data() const noexcept;
    size_t size() const noexcept;

    // Shrinks the buffer, keeping the first new_size bytes
    void resize(size_t new_size);

    // Returns the contents as a string (no encoding, the bytes are copied as is)
    std::string to_string() const;

    // Returns a view of [offset, size())
    const MemoryView from(size_t offset) const;
    // Returns a view of [from, to)
    const MemoryView slice(size_t from, size_t to) const;

private:
    explicit Buffer(std::vector<uint8_t> &&data);

    std::vector<uint8_t> m_data;
};

/*! Object that can refer to a contiguous sequence of bytes. This object does not own the memory. */
class FLEETAPI MemoryView final
{
public:
    MemoryView() noexcept;
    explicit MemoryView(Buffer &buffer) noexcept;
    MemoryView(void *data, size_t size) noexcept;
    MemoryView(const std::string &data) noexcept;
    ~MemoryView() = default;

    MemoryView& operator=(MemoryView&& other) = default;
    MemoryView(const MemoryView &) noexcept = default;
    MemoryView& operator=(const MemoryView &) = default;
    MemoryView(MemoryView &&) noexcept = default;

    static const MemoryView create_const(const void *data, size_t size) noexcept;

    uint8_t* data() noexcept;
    const uint8_t* data() const noexcept;
    size_t size() const noexcept;
    bool empty() const noexcept;

private:
    void *m_data;
    size_t m_size;
};

} /* namespace fleet */

#endif /* _FLEET_BUFFER_HPP_ */
