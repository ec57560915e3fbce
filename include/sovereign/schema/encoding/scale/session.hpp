#pragma once
#include <sovereign/schema/session.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sovereign::schema::encoding::scale {

void encode(session<1>&& o, ::scale::Encoder& encoder);
void decode(session<1>&& o, ::scale::Decoder& decoder);

}  // namespace sovereign::schema::encoding::scale
