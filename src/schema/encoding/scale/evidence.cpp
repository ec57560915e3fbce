#include <sovereign/schema/encoding/scale/evidence.hpp>
#include <sovereign/schema/encoding/scale/ring.hpp>

#include <string>
#include <tuple>
#include <vector>

using namespace sovereign::schema;

namespace sovereign::schema::encoding::scale {

namespace {

// std::map iterates in key order, so the flattened form is canonical.
using metadata_entries_t = std::vector<std::tuple<std::string, std::string>>;

}  // namespace

void encode(evidence<1>&& o, ::scale::Encoder& encoder) {
  auto metadata = metadata_entries_t{};
  metadata.reserve(o.extra_metadata.size());
  for (const auto& [key, value] : o.extra_metadata) {
    metadata.emplace_back(key, value);
  }

  encode(o.version, encoder);
  encode(o.ring, encoder);
  encode(o.session_id, encoder);
  encode(o.quote, encoder);
  encode(o.binding, encoder);
  encode(o.signer_public_key_id, encoder);
  encode(o.platform_measurements, encoder);
  encode(o.event_log, encoder);
  encode(o.claims_digest, encoder);
  encode(metadata, encoder);
}

void decode(evidence<1>&& o, ::scale::Decoder& decoder) {
  auto metadata = metadata_entries_t{};

  decode(o.version, decoder);
  decode(o.ring, decoder);
  decode(o.session_id, decoder);
  decode(o.quote, decoder);
  decode(o.binding, decoder);
  decode(o.signer_public_key_id, decoder);
  decode(o.platform_measurements, decoder);
  decode(o.event_log, decoder);
  decode(o.claims_digest, decoder);
  decode(metadata, decoder);

  o.extra_metadata.clear();
  for (auto& [key, value] : metadata) {
    o.extra_metadata.emplace(std::move(key), std::move(value));
  }
}

}  // namespace sovereign::schema::encoding::scale
