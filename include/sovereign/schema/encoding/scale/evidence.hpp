#pragma once
#include <sovereign/schema/evidence.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sovereign::schema::encoding::scale {

void encode(evidence<1>&& o, ::scale::Encoder& encoder);
void decode(evidence<1>&& o, ::scale::Decoder& decoder);

}  // namespace sovereign::schema::encoding::scale
