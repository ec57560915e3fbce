#include <sovereign/crypto/digest.hpp>
#include <sovereign/crypto/key.hpp>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <array>

namespace sovereign::crypto {

namespace {

using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;

bio_ptr make_read_bio(const std::string_view& data) {
  return bio_ptr{BIO_new_mem_buf(data.data(), static_cast<int>(data.size())),
                 BIO_free};
}

}  // namespace

std::string last_openssl_error() {
  auto code = ERR_get_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  auto buffer = std::array<char, 256>{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  ERR_clear_error();
  return std::string{buffer.data()};
}

std::optional<evp_pkey_ptr> parse_public_key(const std::string_view& pem,
                                             std::string& error) {
  if (pem.empty()) {
    error = "empty public key encoding";
    return std::nullopt;
  }

  if (pem.find("-----BEGIN CERTIFICATE-----") != std::string_view::npos) {
    auto bio = make_read_bio(pem);
    auto certificate = x509_ptr{
        PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), X509_free};
    if (!certificate) {
      error = "failed to parse PEM certificate: " + last_openssl_error();
      return std::nullopt;
    }
    auto key = evp_pkey_ptr{X509_get_pubkey(certificate.get()), EVP_PKEY_free};
    if (!key) {
      error = "certificate carries no usable public key";
      return std::nullopt;
    }
    return key;
  }

  auto bio = make_read_bio(pem);
  auto key = evp_pkey_ptr{
      PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free};
  if (!key) {
    error = "failed to parse PEM public key: " + last_openssl_error();
    return std::nullopt;
  }
  return key;
}

std::optional<evp_pkey_ptr> parse_private_key(const std::string_view& pem,
                                              std::string& error) {
  auto bio = make_read_bio(pem);
  auto key = evp_pkey_ptr{
      PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr),
      EVP_PKEY_free};
  if (!key) {
    error = "failed to parse PEM private key: " + last_openssl_error();
    return std::nullopt;
  }
  return key;
}

std::optional<evp_pkey_ptr> parse_certificate_der(
    const sovereign::schema::bytes_view_t& der,
    std::string& error) {
  const auto* cursor = der.data();
  auto certificate = x509_ptr{
      d2i_X509(nullptr, &cursor, static_cast<long>(der.size())), X509_free};
  if (!certificate) {
    error = "failed to parse DER certificate: " + last_openssl_error();
    return std::nullopt;
  }
  auto key = evp_pkey_ptr{X509_get_pubkey(certificate.get()), EVP_PKEY_free};
  if (!key) {
    error = "certificate carries no usable public key";
    return std::nullopt;
  }
  return key;
}

key_type_t key_type(const EVP_PKEY& key) {
  switch (EVP_PKEY_get_base_id(&key)) {
    case EVP_PKEY_RSA:
    case EVP_PKEY_RSA_PSS:
      return key_type_t::rsa;
    case EVP_PKEY_ED25519:
      return key_type_t::ed25519;
    default:
      return key_type_t::unsupported;
  }
}

std::string public_key_pem(const EVP_PKEY& key) {
  auto bio = bio_ptr{BIO_new(BIO_s_mem()), BIO_free};
  if (!bio || PEM_write_bio_PUBKEY(bio.get(), &key) != 1) {
    return {};
  }
  char* data = nullptr;
  auto size = BIO_get_mem_data(bio.get(), &data);
  return std::string{data, static_cast<size_t>(size)};
}

sovereign::schema::bytes_t public_key_der(const EVP_PKEY& key) {
  auto size = i2d_PUBKEY(&key, nullptr);
  if (size <= 0) {
    return {};
  }
  auto der = sovereign::schema::bytes_t(static_cast<size_t>(size));
  auto* cursor = der.data();
  i2d_PUBKEY(&key, &cursor);
  return der;
}

std::string public_key_id(const EVP_PKEY& key) {
  auto der = public_key_der(key);
  auto digest = sha256(sovereign::schema::bytes_view_t{der.data(), der.size()});
  return sovereign::schema::to_hex(
      sovereign::schema::bytes_view_t{digest.data(), digest.size()});
}

}  // namespace sovereign::crypto
