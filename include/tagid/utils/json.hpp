#pragma once

#include "nlohmann/json.hpp"

#include "tagid/tagid_id.hpp"
#include "tagid/tagid_optional_id.hpp"

// Serialization only. There is no from_json, an id is never read back from an external representation.
namespace tagid
{
    template <typename tag_t, id_value value_t>
    void to_json(nlohmann::json& json, const id<tag_t, value_t>& identifier)
    {
        json = identifier.value();
    }

    template <typename tag_t, id_value value_t>
    void to_json(nlohmann::json& json, const optional_id<tag_t, value_t>& optional_id)
    {
        if (optional_id.has_value())
        {
            json = (*optional_id).value();
        }
        else
        {
            json = nullptr;
        }
    }
}
