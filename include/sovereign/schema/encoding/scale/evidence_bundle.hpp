#pragma once
#include <sovereign/schema/evidence_bundle.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sovereign::schema::encoding::scale {

void encode(evidence_bundle<1>&& o, ::scale::Encoder& encoder);
void decode(evidence_bundle<1>&& o, ::scale::Decoder& decoder);

}  // namespace sovereign::schema::encoding::scale
