#pragma once

#include <sovereign/schema/ring.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(sovereign::schema,
                             ring_t,
                             sovereign::schema::ring_t::host,
                             sovereign::schema::ring_t::vm,
                             sovereign::schema::ring_t::workload)
