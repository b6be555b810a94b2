#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <string>

#include "tagid/misc/type_name.hpp"
#include "tagid/tagid_counter.hpp"

namespace tagid
{
    /**
     * Unique identifier of the namespace tag_t. The tag is never instantiated, it only makes ids of unrelated tags
     * distinct types, so they can be neither compared nor assigned to one another.
     *
     * An id is only obtained from mint(), which never returns the same value twice for the same tag and value type, or
     * from unchecked(), which leaves uniqueness to the caller. The value is never zero, zero is kept to encode an
     * absent id (see optional_id).
     */
    template <typename tag_t, id_value value_t = std::size_t>
    struct id
    {
        using tag_type = tag_t;
        using value_type = value_t;
        using counter_type = counter<tag_t, value_t>;

        /**
         * Sentinel id with the lowest valid value. This does not mint, the counter is neither read nor advanced, so
         * the sentinel compares equal to the first minted id.
         */
        constexpr id() noexcept = default;

        /**
         * Create a new unique id. Throws tagid_error with code exhausted once every value of value_t was handed out.
         */
        [[nodiscard]] static id mint()
        {
            return id(counter_type::next());
        }

        /**
         * Create an id from the given value without touching the counter. The value must not be zero, and it should
         * not collide with a value minted for this tag, otherwise two ids that should be distinct compare equal.
         */
        [[nodiscard]] static constexpr id unchecked(const value_t value) noexcept
        {
            return id(value);
        }

        [[nodiscard]] constexpr value_t value() const noexcept
        {
            return _value;
        }

        constexpr auto operator<=>(const id&) const noexcept = default;

      private:
        value_t _value = 1;

        constexpr explicit id(const value_t value) noexcept
            : _value(value)
        {
        }
    };

    template <typename tag_t>
    using id_u8 = id<tag_t, std::uint8_t>;

    template <typename tag_t>
    using id_u16 = id<tag_t, std::uint16_t>;

    template <typename tag_t>
    using id_u32 = id<tag_t, std::uint32_t>;

    template <typename tag_t>
    using id_u64 = id<tag_t, std::uint64_t>;
}

template <typename tag_t, tagid::id_value value_t>
struct std::hash<tagid::id<tag_t, value_t>>
{
    std::size_t operator()(const tagid::id<tag_t, value_t>& id) const noexcept
    {
        return std::hash<value_t>()(id.value());
    }
};

// "{}" renders the bare value, "{:?}" renders the tag as well, e.g. id<player>(42).
template <typename tag_t, tagid::id_value value_t>
struct std::formatter<tagid::id<tag_t, value_t>>
{
    bool debug = false;

    constexpr auto parse(std::format_parse_context& ctx)
    {
        auto it = ctx.begin();

        if (it != ctx.end() && *it == '?')
        {
            debug = true;
            ++it;
        }

        if (it != ctx.end() && *it != '}') [[unlikely]]
        {
            throw std::format_error("invalid format specifier for tagid::id");
        }

        return it;
    }

    auto format(const tagid::id<tag_t, value_t>& id, std::format_context& ctx) const -> decltype(ctx.out())
    {
        if (debug)
        {
            return std::format_to(ctx.out(), "id<{}>({})", tagid::type_name<tag_t>(), id.value());
        }

        return std::format_to(ctx.out(), "{}", id.value());
    }
};

namespace tagid
{
    template <typename tag_t, id_value value_t>
    std::string to_string(const id<tag_t, value_t>& identifier)
    {
        return std::format("{}", identifier);
    }
}
