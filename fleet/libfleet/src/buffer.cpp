/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file buffer.cpp
 * @brief Buffer helper class
 **/

#include "fleet/buffer.hpp"

#include "common/utils.hpp"

#include <new>
#include <cstring>

namespace fleet
{

Buffer::Buffer() = default;

Buffer::Buffer(std::vector<uint8_t> &&data) :
    m_data(std::move(data))
{}

Expected<Buffer> Buffer::create(size_t size)
{
    return create(size, 0);
}

Expected<Buffer> Buffer::create(size_t size, uint8_t default_value)
{
    std::vector<uint8_t> data;
    try {
        data.assign(size, default_value);
    } catch (const std::bad_alloc &) {
        LOGGER__ERROR("Failed allocating buffer of size {}", size);
        return make_unexpected(FLEET_OUT_OF_HOST_MEMORY);
    }
    return Buffer(std::move(data));
}

Expected<Buffer> Buffer::create(const uint8_t *src, size_t size)
{
    TRY(auto buffer, create(size));
    if (0 != size) {
        std::memcpy(buffer.data(), src, size);
    }
    return buffer;
}

Expected<BufferPtr> Buffer::create_shared(size_t size)
{
    TRY(auto buffer, create(size));
    auto buffer_ptr = make_shared_nothrow<Buffer>(std::move(buffer));
    CHECK_NOT_NULL_AS_EXPECTED(buffer_ptr, FLEET_OUT_OF_HOST_MEMORY);
    return buffer_ptr;
}

Expected<Buffer> Buffer::copy() const
{
    return create(data(), size());
}

bool Buffer::operator==(const Buffer& rhs) const
{
    return m_data == rhs.m_data;
}

bool Buffer::operator!=(const Buffer& rhs) const
{
    return !(*this == rhs);
}

uint8_t* Buffer::data() noexcept
{
    return m_data.data();
}

const uint8_t* Buffer::data() const noexcept
{
    return m_data.data();
}

size_t Buffer::size() const noexcept
{
    return m_data.size();
}

void Buffer::resize(size_t new_size)
{
    if (new_size < m_data.size()) {
        m_data.resize(new_size);
    }
}

std::string Buffer::to_string() const
{
    return std::string(reinterpret_cast<const char*>(m_data.data()), m_data.size());
}

const MemoryView Buffer::from(size_t offset) const
{
    return slice(offset, size());
}

const MemoryView Buffer::slice(size_t from, size_t to) const
{
    if ((from > to) || (to > size())) {
        return MemoryView();
    }
    return MemoryView::create_const(data() + from, to - from);
}

MemoryView::MemoryView() noexcept :
    m_data(nullptr),
    m_size(0)
{}

MemoryView::MemoryView(Buffer &buffer) noexcept :
    m_data(buffer.data()),
    m_size(buffer.size())
{}

MemoryView::MemoryView(void *data, size_t size) noexcept :
    m_data(data),
    m_size(size)
{}

MemoryView::MemoryView(const std::string &data) noexcept :
    m_data(const_cast<char*>(data.c_str())),
    m_size(data.size())
{}

const MemoryView MemoryView::create_const(const void *data, size_t size) noexcept
{
    return MemoryView(const_cast<void *>(data), size);
}

uint8_t* MemoryView::data() noexcept
{
    return reinterpret_cast<uint8_t*>(m_data);
}

const uint8_t* MemoryView::data() const noexcept
{
    return reinterpret_cast<const uint8_t*>(m_data);
}

size_t MemoryView::size() const noexcept
{
    return m_size;
}

bool MemoryView::empty() const noexcept
{
    return (m_data == nullptr);
}

} /* namespace fleet */
