#pragma once

#include <atomic>
#include <concepts>
#include <cstddef>
#include <limits>

#include "tagid/misc/type_name.hpp"
#include "tagid/tagid_error.hpp"

namespace tagid
{
    template <typename value_t>
    concept id_value = std::unsigned_integral<value_t> && !std::same_as<value_t, bool> && std::atomic<value_t>::is_always_lock_free;

    /**
     * Allocation cursor of one namespace. Every (tag_t, value_t) pair owns its own cursor, created on first use and
     * never reset. The cursor holds the number of values handed out so far, hence the first value is 1.
     */
    template <typename tag_t, id_value value_t = std::size_t>
    struct counter
    {
        counter() = delete;

        [[nodiscard]] static value_t next()
        {
            constexpr value_t max_value = std::numeric_limits<value_t>::max();

            std::atomic<value_t>& cursor = get_cursor();
            value_t current = cursor.load(std::memory_order_relaxed);

            do
            {
                // nothing is stored once the cursor reaches max_value
                if (current == max_value) [[unlikely]]
                {
                    detail::raise_exhausted(type_name<tag_t>(), type_name<value_t>(), max_value);
                }
            } while (!cursor.compare_exchange_weak(current, static_cast<value_t>(current + 1), std::memory_order_relaxed));

            return static_cast<value_t>(current + 1);
        }

        [[nodiscard]] static value_t minted()
        {
            return get_cursor().load(std::memory_order_relaxed);
        }

      private:
        static std::atomic<value_t>& get_cursor()
        {
            static std::atomic<value_t> cursor {0};
            return cursor;
        }
    };
}
