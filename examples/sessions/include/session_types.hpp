#pragma once

#include <string>
#include <string_view>

#include "tagid/tagid.hpp"

namespace tagid::examples::sessions
{
    struct session_tag
    {
        static constexpr std::string_view tag_name = "session";
    };

    struct user_tag
    {
    };

    using session_id = id<session_tag>;
    using user_id = id_u32<user_tag>;

    struct session
    {
        session_id id = session_id::mint();
        user_id user;
        optional_id<session_tag> parent;
        std::string name;
    };
}
