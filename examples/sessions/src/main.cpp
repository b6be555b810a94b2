#include <format>
#include <iostream>
#include <unordered_map>

#include "spdlog/spdlog.h"

#include "session_types.hpp"

using namespace tagid::examples::sessions;

int main()
{
    spdlog::set_pattern("%l: %v");

    const user_id alice = user_id::mint();
    const user_id bob = user_id::mint();

    std::unordered_map<session_id, session> sessions;

    const session login {.user = alice, .name = "login"};
    const session upload {.user = alice, .parent = login.id, .name = "upload"};
    const session browse {.user = bob, .name = "browse"};

    for (const session& value : {login, upload, browse})
    {
        sessions.emplace(value.id, value);
    }

    for (const auto& [id, value] : sessions)
    {
        std::cout << std::format("{:?} user={:?} parent={} name={}", id, value.user, value.parent, value.name) << std::endl;
    }

    // does not compile, a user id is not a session id
    // sessions.find(alice);

    std::cout << "sessions minted: " << session_id::counter_type::minted() << std::endl;

    return 0;
}
