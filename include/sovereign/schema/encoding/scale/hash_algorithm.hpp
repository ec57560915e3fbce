#pragma once

#include <sovereign/schema/hash_algorithm.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(sovereign::schema,
                             hash_algorithm_t,
                             sovereign::schema::hash_algorithm_t::sha256,
                             sovereign::schema::hash_algorithm_t::sha384,
                             sovereign::schema::hash_algorithm_t::sha512)
