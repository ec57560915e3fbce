#include <sovereign/schema/encoding/scale/evidence.hpp>
#include <sovereign/schema/encoding/scale/evidence_bundle.hpp>
#include <sovereign/schema/encoding/scale/hash_algorithm.hpp>
#include <sovereign/schema/encoding/scale/signature_scheme.hpp>

using namespace sovereign::schema;

namespace sovereign::schema::encoding::scale {

void encode(evidence_bundle<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.session_id, encoder);
  encode(o.challenge_nonce, encoder);
  encode(o.entries, encoder);
  encode(o.app_key_public, encoder);
  encode(o.app_key_certificate, encoder);
  encode(o.agent_uuid, encoder);
  encode(o.workload_code_hash, encoder);
  encode(o.signature_hash, encoder);
  encode(o.signature_scheme, encoder);
  encode(o.signature_salt_length, encoder);
  encode(o.signature, encoder);
}

void decode(evidence_bundle<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.session_id, decoder);
  decode(o.challenge_nonce, decoder);
  decode(o.entries, decoder);
  decode(o.app_key_public, decoder);
  decode(o.app_key_certificate, decoder);
  decode(o.agent_uuid, decoder);
  decode(o.workload_code_hash, decoder);
  decode(o.signature_hash, decoder);
  decode(o.signature_scheme, decoder);
  decode(o.signature_salt_length, decoder);
  decode(o.signature, decoder);
}

}  // namespace sovereign::schema::encoding::scale
