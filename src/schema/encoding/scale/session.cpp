#include <sovereign/schema/encoding/scale/session.hpp>

using namespace sovereign::schema;

namespace sovereign::schema::encoding::scale {

void encode(session<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.session_id, encoder);
  encode(o.nonce_host, encoder);
  encode(o.nonce_vm, encoder);
  encode(o.nonce_workload, encoder);
  encode(o.issued_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.consumed, encoder);
}

void decode(session<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.session_id, decoder);
  decode(o.nonce_host, decoder);
  decode(o.nonce_vm, decoder);
  decode(o.nonce_workload, decoder);
  decode(o.issued_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.consumed, decoder);
}

}  // namespace sovereign::schema::encoding::scale
