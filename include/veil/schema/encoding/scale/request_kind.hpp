#pragma once

#include <veil/schema/request_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    veil::schema,
    request_kind_t,
    veil::schema::request_kind_t::submission_reveal,
    veil::schema::request_kind_t::bucket_count_reveal)
