#pragma once

#include <cstddef>
#include <format>
#include <functional>
#include <optional>

#include "tagid/misc/type_name.hpp"
#include "tagid/tagid_error.hpp"
#include "tagid/tagid_id.hpp"

namespace tagid
{
    /**
     * Id that may be absent. Absence is stored as the reserved zero value, so an optional_id takes no more room than
     * the id itself, unlike std::optional.
     */
    template <typename tag_t, id_value value_t = std::size_t>
    struct optional_id
    {
        using id_type = id<tag_t, value_t>;

        constexpr optional_id() noexcept = default;

        constexpr optional_id(std::nullopt_t) noexcept
        {
        }

        constexpr optional_id(const id_type identifier) noexcept
            : _value(identifier.value())
        {
        }

        constexpr optional_id& operator=(std::nullopt_t) noexcept
        {
            reset();
            return *this;
        }

        constexpr optional_id& operator=(const id_type identifier) noexcept
        {
            _value = identifier.value();
            return *this;
        }

        [[nodiscard]] constexpr bool has_value() const noexcept
        {
            return _value != 0;
        }

        constexpr explicit operator bool() const noexcept
        {
            return has_value();
        }

        [[nodiscard]] id_type value() const
        {
            if (!has_value()) [[unlikely]]
            {
                throw tagid_error(tagid_error_code::empty, "optional_id<{}> has no value", type_name<tag_t>());
            }

            return id_type::unchecked(_value);
        }

        [[nodiscard]] constexpr id_type value_or(const id_type fallback) const noexcept
        {
            return has_value() ? id_type::unchecked(_value) : fallback;
        }

        constexpr id_type operator*() const noexcept
        {
            return id_type::unchecked(_value);
        }

        constexpr void reset() noexcept
        {
            _value = 0;
        }

        constexpr bool operator==(const optional_id&) const noexcept = default;

        constexpr bool operator==(const id_type identifier) const noexcept
        {
            return _value == identifier.value();
        }

        constexpr bool operator==(std::nullopt_t) const noexcept
        {
            return !has_value();
        }

      private:
        value_t _value = 0;
    };
}

template <typename tag_t, tagid::id_value value_t>
struct std::hash<tagid::optional_id<tag_t, value_t>>
{
    std::size_t operator()(const tagid::optional_id<tag_t, value_t>& optional_id) const noexcept
    {
        return std::hash<value_t>()(optional_id.has_value() ? (*optional_id).value() : value_t {0});
    }
};

template <typename tag_t, tagid::id_value value_t>
struct std::formatter<tagid::optional_id<tag_t, value_t>> : std::formatter<tagid::id<tag_t, value_t>>
{
    auto format(const tagid::optional_id<tag_t, value_t>& optional_id, std::format_context& ctx) const -> decltype(ctx.out())
    {
        if (optional_id.has_value())
        {
            return std::formatter<tagid::id<tag_t, value_t>>::format(*optional_id, ctx);
        }

        if (this->debug)
        {
            return std::format_to(ctx.out(), "id<{}>(none)", tagid::type_name<tag_t>());
        }

        return std::format_to(ctx.out(), "none");
    }
};
