/// @file Expected.hpp
/// @brief `XNS::Utilities::Expected<T, E>`: inline value-or-error return type.
#pragma once

#include <XNS/Defines.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace XNS::Utilities
{
    /// @brief Wrapper used to explicitly construct an error value for `Expected<T, E>`.
    ///
    /// @tparam E Error type.
    template<class E>
    class Unexpected
    {
    public:
        /// @brief Error type.
        using ErrorType = E;

        constexpr explicit Unexpected(const E& error) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_error {error}
        {
        }

        constexpr explicit Unexpected(E&& error) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error {std::move(error)}
        {
        }

        [[nodiscard]] constexpr E&       Error() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& Error() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&&      Error() && noexcept { return std::move(m_error); }

    private:
        E m_error;
    };

    namespace detail
    {
        [[noreturn]] inline void ExpectedFailNoValue() noexcept
        {
            XNS_ABORT("XNS::Utilities::Expected::Value called when holding error");
        }

        [[noreturn]] inline void ExpectedFailNoError() noexcept
        {
            XNS_ABORT("XNS::Utilities::Expected::Error called when holding value");
        }
    }// namespace detail

    /// @brief Holds either a `T` or an `E`, never both and never neither.
    ///
    /// Accessing the inactive alternative through `Value()` / `Error()` is a contract
    /// violation and aborts. The `...Unsafe()` accessors skip the check.
    ///
    /// @tparam T Value type.
    /// @tparam E Error type.
    template<class T, class E>
    class [[nodiscard]] Expected
    {
        static_assert(!std::is_reference_v<T>, "Expected<T&,...> is not supported.");
        static_assert(!std::is_reference_v<E>, "Expected<...,E&> is not supported.");
        static_assert(!std::is_same_v<T, E>, "Expected<T,T> is ambiguous.");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr explicit Expected(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
            : m_hasValue {true}
        {
            std::construct_at(std::addressof(m_value), value);
        }

        constexpr explicit Expected(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
            : m_hasValue {true}
        {
            std::construct_at(std::addressof(m_value), std::move(value));
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_hasValue {false}
        {
            std::construct_at(std::addressof(m_error), std::move(unexpected).Error());
        }

        constexpr Expected(const Expected& other)
            requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
            : m_hasValue {other.m_hasValue}
        {
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), other.m_value);
            else
                std::construct_at(std::addressof(m_error), other.m_error);
        }

        constexpr Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                      std::is_nothrow_move_constructible_v<E>)
            : m_hasValue {other.m_hasValue}
        {
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), std::move(other.m_value));
            else
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }

        constexpr Expected& operator=(const Expected& other)
            requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
        {
            if (this != &other)
            {
                DestroyActive();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    std::construct_at(std::addressof(m_value), other.m_value);
                else
                    std::construct_at(std::addressof(m_error), other.m_error);
            }
            return *this;
        }

        constexpr Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                                 std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                DestroyActive();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    std::construct_at(std::addressof(m_value), std::move(other.m_value));
                else
                    std::construct_at(std::addressof(m_error), std::move(other.m_error));
            }
            return *this;
        }

        constexpr ~Expected() noexcept
        {
            DestroyActive();
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr T& Value() & noexcept
        {
            if (!m_hasValue)
                detail::ExpectedFailNoValue();
            return m_value;
        }

        [[nodiscard]] constexpr const T& Value() const& noexcept
        {
            if (!m_hasValue)
                detail::ExpectedFailNoValue();
            return m_value;
        }

        [[nodiscard]] constexpr T&& Value() && noexcept
        {
            if (!m_hasValue)
                detail::ExpectedFailNoValue();
            return std::move(m_value);
        }

        [[nodiscard]] constexpr E& Error() & noexcept
        {
            if (m_hasValue)
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] constexpr const E& Error() const& noexcept
        {
            if (m_hasValue)
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] constexpr E&& Error() && noexcept
        {
            if (m_hasValue)
                detail::ExpectedFailNoError();
            return std::move(m_error);
        }

        [[nodiscard]] constexpr T&       ValueUnsafe() & noexcept { return m_value; }
        [[nodiscard]] constexpr const T& ValueUnsafe() const& noexcept { return m_value; }
        [[nodiscard]] constexpr T&&      ValueUnsafe() && noexcept { return std::move(m_value); }

        [[nodiscard]] constexpr E&       ErrorUnsafe() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&&      ErrorUnsafe() && noexcept { return std::move(m_error); }

    private:
        constexpr void DestroyActive() noexcept
        {
            if (m_hasValue)
                std::destroy_at(std::addressof(m_value));
            else
                std::destroy_at(std::addressof(m_error));
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue {false};
    };

    /// @brief `Expected` specialization for operations that only report failure.
    template<class E>
    class [[nodiscard]] Expected<void, E>
    {
        static_assert(!std::is_reference_v<E>, "Expected<void,E&> is not supported.");

    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Expected() noexcept
            : m_hasValue {true}
        {
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_hasValue {false}
        {
            std::construct_at(std::addressof(m_error), std::move(unexpected).Error());
        }

        constexpr Expected(const Expected& other)
            requires(std::is_copy_constructible_v<E>)
            : m_hasValue {other.m_hasValue}
        {
            if (!m_hasValue)
                std::construct_at(std::addressof(m_error), other.m_error);
        }

        constexpr Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_hasValue {other.m_hasValue}
        {
            if (!m_hasValue)
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }

        constexpr Expected& operator=(const Expected& other)
            requires(std::is_copy_constructible_v<E>)
        {
            if (this != &other)
            {
                DestroyActive();
                m_hasValue = other.m_hasValue;
                if (!m_hasValue)
                    std::construct_at(std::addressof(m_error), other.m_error);
            }
            return *this;
        }

        constexpr Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                DestroyActive();
                m_hasValue = other.m_hasValue;
                if (!m_hasValue)
                    std::construct_at(std::addressof(m_error), std::move(other.m_error));
            }
            return *this;
        }

        constexpr ~Expected() noexcept
        {
            DestroyActive();
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        constexpr explicit operator bool() const noexcept { return HasValue(); }

        constexpr void Value() const noexcept
        {
            if (!m_hasValue)
                detail::ExpectedFailNoValue();
        }

        [[nodiscard]] constexpr E& Error() & noexcept
        {
            if (m_hasValue)
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] constexpr const E& Error() const& noexcept
        {
            if (m_hasValue)
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] constexpr E&& Error() && noexcept
        {
            if (m_hasValue)
                detail::ExpectedFailNoError();
            return std::move(m_error);
        }

        [[nodiscard]] constexpr E&       ErrorUnsafe() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return m_error; }

    private:
        constexpr void DestroyActive() noexcept
        {
            if (!m_hasValue)
                std::destroy_at(std::addressof(m_error));
        }

        union
        {
            E m_error;
        };
        bool m_hasValue {true};
    };
}// namespace XNS::Utilities
