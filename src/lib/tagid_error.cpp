#include "spdlog/spdlog.h"

#include "tagid/tagid_error.hpp"

namespace tagid::detail
{
    void raise_exhausted(const std::string_view tag_name, const std::string_view value_type_name, const std::uintmax_t max_value)
    {
        SPDLOG_CRITICAL("id counter exhausted, tag={} type={} max={}", tag_name, value_type_name, max_value);
        throw tagid_error(tagid_error_code::exhausted, "id counter of {} exhausted, every {} up to {} was minted", tag_name, value_type_name, max_value);
    }
}
