/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file expected.hpp
 * @brief Expected<T> is either a T or the ::fleet_status preventing T to be created.
 *
 * Example - reading a part:
 *
 * static Expected<Buffer> read_part(const ContentChunker &chunker, uint32_t index)
 * {
 *     if (index >= chunker.parts_count()) {
 *         LOGGER__ERROR("Part index {} out of range", index);
 *         return make_unexpected(FLEET_INVALID_ARGUMENT);
 *     }
 *     return chunker.read_part(index);
 * }
 *
 * static fleet_status use_part(const ContentChunker &chunker)
 * {
 *     auto part = read_part(chunker, 0);
 *     if (!part) {
 *         return part.status();
 *     }
 *     // Use part ...
 *     return FLEET_SUCCESS;
 * }
 **/

#ifndef _FLEET_EXPECTED_HPP_
#define _FLEET_EXPECTED_HPP_

#include "fleet/fleet.h"

#include <assert.h>
#include <functional>
#include <utility>
#include <type_traits>
#include <stdexcept>
#include <sstream>

/** fleet namespace */
namespace fleet
{

/*! fleet_error is an Exception object that inherits from std::runtime_error. */
class fleet_error : public std::runtime_error
{
public:
    template<typename... Args>
    fleet_error(fleet_status status, Args&&... args) :
        std::runtime_error(std::forward<Args>(args)...), m_status(status)
    {}

    /**
     * Returns the error status that caused this exception.
     */
    fleet_status status() const {
        return m_status;
    }

private:
    fleet_status m_status;
};

/*! Unexpected is an object containing ::fleet_status error, used when an unexpected outcome occurred. */
class Unexpected final
{
public:
    explicit Unexpected(fleet_status status) :
        m_status(status)
    {}

    operator fleet_status() { return m_status; }

    fleet_status m_status;
};

inline Unexpected make_unexpected(fleet_status status)
{
    return Unexpected(status);
}

/*! Expected<T> is either a T or the ::fleet_status preventing T to be created.*/
template<typename T>
class Expected final
{
public:
    /**
     * Expected<T> can access Expected\<U\>'s private members (needed for implicit upcasting)
     */
    template<class U>
    friend class Expected;

    /**
     * Construct a new Expected<T> from an Unexpected status.
     *
     * NOTE: Asserting that status is not FLEET_SUCCESS if NDEBUG is not defined.
     */
    Expected(Unexpected unexpected) :
        m_status(unexpected.m_status)
    {
        assert(unexpected.m_status != FLEET_SUCCESS);
    }

    /**
     * Copy constructor
     */
    explicit Expected(const Expected<T> &other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, other.m_value);
        }
    }

    /**
     * Copy constructor for implicit upcasting
     */
    template <typename U>
    Expected(const Expected<U>& other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, other.m_value);
        }
    }

    /**
     * Move constructor
     *
     * If other had value before the move, it will still have the value that was moved (so the value object is valid but
     * in an unspecified state).
     */
    Expected(Expected<T> &&other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, std::move(other.m_value));
        }
    }

    /**
     * Construct a new Expected<T> from an rvalue T.
     */
    Expected(T &&value) :
        m_value(std::move(value)),
        m_status(FLEET_SUCCESS)
    {}

    /**
     * This will prevent the T value to be of type fleet_status.
     * The goal is to prevent bugs of returning fleet_status as int value, instead of make_unexpected() with error status.
     */
    Expected(fleet_status status) = delete;

    /**
     * Construct a new Expected<T> by forwarding arguments to T constructors.
     *
     * NOTE: std::enable_if_t used because the variadic constructor can sometimes have a better cv-qualifier match than
     *       the other constructors.
     */
    template <typename... Args, std::enable_if_t<std::is_constructible<T, Args...>::value, int> = 0>
    explicit Expected(Args &&...args) :
        m_value(std::forward<Args>(args)...),
        m_status(FLEET_SUCCESS)
    {}

    Expected<T>& operator=(const Expected<T> &other) = delete;
    Expected<T>& operator=(Expected<T> &&other) noexcept = delete;
    Expected<T>& operator=(const T &other) = delete;
    Expected<T>& operator=(T &&other) noexcept = delete;
    Expected<T>& operator=(fleet_status status) = delete;

    ~Expected()
    {
        if (has_value()) {
            m_status = FLEET_UNINITIALIZED;
            m_value.~T();
        }
    }

    /**
     * Make an existing Expected<T> to Unexpected. Destructs T if has value.
     */
    void make_unexpected(fleet_status status)
    {
        assert(status != FLEET_SUCCESS);
        if (has_value()) {
            m_value.~T();
        }
        m_status = status;
    }

    /**
     * Checks whether the object contains a value.
     */
    bool has_value() const
    {
        return (FLEET_SUCCESS == m_status);
    }

    /**
     * Returns the contained value.
     * @note This method must be called with a valid value inside! otherwise it can lead to undefined behavior.
     */
    T& value() &
    {
        assert(has_value());
        return m_value;
    }

    const T& value() const&
    {
        assert(has_value());
        return m_value;
    }

    /**
     * Returns the status.
     */
    fleet_status status() const
    {
        return m_status;
    }

    /**
     * Releases ownership of its stored value, by returning its value and making this object Unexpected.
     * @note This method must be called with a valid value inside! otherwise it can lead to undefined behavior.
     */
    T release()
    {
        assert(has_value());
        T tmp = std::move(m_value);
        make_unexpected(FLEET_UNINITIALIZED);
        return tmp;
    }

    /**
     * If the object contains a value, releases ownership of the stored value.
     * If the object is Unexpected, throws an exception of type fleet_error.
     */
    T expect(const std::string &msg) &&
    {
        if (!has_value()) {
            std::stringstream ss;
            ss << "Expected::expect() failed with status=";
            ss << static_cast<int>(status());
            ss << ". ";
            ss << msg;
            throw fleet_error(status(), ss.str());
        }
        return release();
    }

    T* operator->()
    {
        assert(has_value());
        return &(value());
    }

    const T* operator->() const
    {
        assert(has_value());
        return &(value());
    }

    T& operator*() &
    {
        assert(has_value());
        return value();
    }

    const T& operator*() const&
    {
        assert(has_value());
        return value();
    }

    explicit operator bool() const
    {
        return has_value();
    }

private:
    template<typename... Args>
    static void construct(T *value, Args &&...args)
    {
        new ((void*)value) T(std::forward<Args>(args)...);
    }

    union {
        T m_value;
    };
    fleet_status m_status;
};

template <typename T>
using ExpectedRef = Expected<std::reference_wrapper<T>>;

} /* namespace fleet */

#endif  // _FLEET_EXPECTED_HPP_
