#pragma once

#include <veil/schema/ciphertext.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(veil::schema,
                             ciphertext_type_t,
                             veil::schema::ciphertext_type_t::euint64,
                             veil::schema::ciphertext_type_t::ebytes)
