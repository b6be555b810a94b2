#pragma once

#include "tagid/tagid_counter.hpp"
#include "tagid/tagid_error.hpp"
#include "tagid/tagid_id.hpp"
#include "tagid/tagid_optional_id.hpp"
#include "tagid/tagid_version.hpp"
