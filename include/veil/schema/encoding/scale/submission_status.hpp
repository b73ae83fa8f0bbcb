#pragma once

#include <veil/schema/submission_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(veil::schema,
                             submission_status_t,
                             veil::schema::submission_status_t::pending,
                             veil::schema::submission_status_t::verified,
                             veil::schema::submission_status_t::rejected)
