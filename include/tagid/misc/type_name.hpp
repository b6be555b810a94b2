#pragma once

#include <concepts>
#include <string_view>

#include "tagid/tagid_macros.hpp"

namespace tagid
{
    template <typename tag_t>
    concept has_tag_name = requires {
        { tag_t::tag_name } -> std::convertible_to<std::string_view>;
    };

    namespace detail
    {
        template <typename T>
        constexpr std::string_view pretty_function()
        {
            return TAGID_PRETTY_FUNCTION;
        }

        constexpr std::string_view remove_prefix(std::string_view name, const std::string_view prefix)
        {
            if (name.starts_with(prefix))
            {
                name.remove_prefix(prefix.size());
            }

            return name;
        }

        constexpr std::string_view extract_type_name(const std::string_view function)
        {
            constexpr std::string_view prefix = TAGID_PRETTY_FUNCTION_PREFIX;
            constexpr std::string_view suffix = TAGID_PRETTY_FUNCTION_SUFFIX;
            constexpr std::string_view unknown = "<unknown>";

            if (prefix.empty())
            {
                return unknown;
            }

            const std::size_t prefix_index = function.find(prefix);

            if (prefix_index == std::string_view::npos)
            {
                return unknown;
            }

            const std::size_t first = prefix_index + prefix.size();

#if defined(_MSC_VER) && !defined(__clang__)
            const std::size_t last = function.rfind(suffix);
#else
            const std::size_t last = function.find_first_of(suffix, first);
#endif

            if (last == std::string_view::npos || last <= first)
            {
                return unknown;
            }

            std::string_view name = function.substr(first, last - first);

            // msvc spells out the class key
            name = remove_prefix(name, "struct ");
            name = remove_prefix(name, "class ");
            name = remove_prefix(name, "enum ");

            return name;
        }
    }

    /**
     * Name of the given tag, either its own tag_name member or the fully qualified name the compiler gives it.
     */
    template <typename tag_t>
    constexpr std::string_view type_name()
    {
        if constexpr (has_tag_name<tag_t>)
        {
            return std::string_view(tag_t::tag_name);
        }
        else
        {
            return detail::extract_type_name(detail::pretty_function<tag_t>());
        }
    }
}
