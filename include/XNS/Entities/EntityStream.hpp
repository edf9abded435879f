/// @file EntityStream.hpp
/// @brief Single-pass pull sequence of entities (stackless coroutine) based on `co_yield`.
#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Entities/Entity.hpp>
#include <XNS/Primitives.hpp>

#include <coroutine>
#include <exception>
#include <iterator>
#include <utility>

namespace XNS::Entities
{
    /// @brief A lazy, finite, non-restartable sequence of entity nodes.
    ///
    /// The producing coroutine only runs while the stream is iterated. Once iteration has started,
    /// a second `begin()` continues from where the first left off, and a consumed stream yields nothing.
    class EntityStream final
    {
    public:
        struct promise_type final
        {
            const Entity*      current {nullptr};
            std::exception_ptr error {};

            EntityStream get_return_object() noexcept
            {
                return EntityStream(std::coroutine_handle<promise_type>::from_promise(*this));
            }

            std::suspend_always initial_suspend() noexcept { return {}; }
            std::suspend_always final_suspend() noexcept { return {}; }

            std::suspend_always yield_value(const Entity* entity) noexcept
            {
                current = entity;
                return {};
            }

            void return_void() noexcept {}

            void unhandled_exception() noexcept
            {
                error = std::current_exception();
            }
        };

        using handle_type = std::coroutine_handle<promise_type>;

        EntityStream() noexcept = default;

        explicit EntityStream(handle_type handle) noexcept
            : m_handle(handle)
        {
        }

        EntityStream(EntityStream&& other) noexcept
            : m_handle(std::exchange(other.m_handle, {})), m_yielded(std::exchange(other.m_yielded, 0)), m_started(std::exchange(other.m_started, false))
        {
        }

        EntityStream& operator=(EntityStream&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                m_handle  = std::exchange(other.m_handle, {});
                m_yielded = std::exchange(other.m_yielded, 0);
                m_started = std::exchange(other.m_started, false);
            }
            return *this;
        }

        EntityStream(const EntityStream&)            = delete;
        EntityStream& operator=(const EntityStream&) = delete;

        ~EntityStream()
        {
            Reset();
        }

        class Iterator final
        {
        public:
            using value_type      = const Entity*;
            using reference       = const Entity*;
            using difference_type = std::ptrdiff_t;

            Iterator() noexcept = default;

            explicit Iterator(EntityStream* stream) noexcept
                : m_stream(stream)
            {
            }

            reference operator*() const noexcept
            {
                return m_stream->m_handle.promise().current;
            }

            Iterator& operator++()
            {
                m_stream->Advance();
                return *this;
            }

            friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept
            {
                return !it.m_stream || it.m_stream->IsDone();
            }

        private:
            EntityStream* m_stream {nullptr};
        };

        [[nodiscard]] Iterator begin()
        {
            if (!m_handle)
                return Iterator {};

            if (!m_started)
            {
                m_started = true;
                Advance();
            }

            if (IsDone())
                return Iterator {};
            return Iterator {this};
        }

        [[nodiscard]] std::default_sentinel_t end() const noexcept
        {
            return {};
        }

        /// @brief Number of entities produced so far.
        [[nodiscard]] UIntSize YieldedCount() const noexcept { return m_yielded; }

        [[nodiscard]] bool IsDone() const noexcept { return !m_handle || m_handle.done(); }

    private:
        void Advance()
        {
            if (IsDone())
                return;

            m_handle.resume();
            auto& promise = m_handle.promise();
            if (promise.error)
                std::rethrow_exception(std::exchange(promise.error, {}));
            if (!m_handle.done())
                ++m_yielded;
        }

        void Reset() noexcept
        {
            if (m_handle)
            {
                m_handle.destroy();
                m_handle = {};
            }
        }

        handle_type m_handle {};
        UIntSize    m_yielded {0};
        bool        m_started {false};
    };

    /// @brief Depth-first, pre-order walk over everything reachable from `root`, each node exactly once.
    [[nodiscard]] XNS_API EntityStream WalkEntities(const Entity& root);
}// namespace XNS::Entities
