#pragma once

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string_view>

namespace tagid
{
    enum class tagid_error_code
    {
        none,
        unknown,
        exhausted,
        empty,
    };

    struct tagid_error final : std::runtime_error
    {
        tagid_error_code error_code;

        template <typename... args_t>
        tagid_error(const tagid_error_code error_code, const std::format_string<args_t...> format, args_t&&... args)
            : std::runtime_error(std::format(format, std::forward<args_t>(args)...)),
              error_code(error_code)
        {
        }
    };

    namespace detail
    {
        // Logs and throws. Once raised for a namespace, it is raised for every later mint of that namespace.
        [[noreturn]] void raise_exhausted(std::string_view tag_name, std::string_view value_type_name, std::uintmax_t max_value);
    }
}
