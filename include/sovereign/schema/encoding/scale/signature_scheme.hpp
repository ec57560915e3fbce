#pragma once

#include <sovereign/schema/signature_scheme.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(sovereign::schema,
                             signature_scheme_t,
                             sovereign::schema::signature_scheme_t::rsassa,
                             sovereign::schema::signature_scheme_t::rsapss)
