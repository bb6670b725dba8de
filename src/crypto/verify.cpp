#include <warden/common/critical.hpp>
#include <warden/crypto/verify.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <memory>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::ed25519_public_key_t& public_key,
                      const warden::schema::ed25519_signature_t& signature) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

std::optional<ed25519_keypair_t> generate_keypair() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto keypair = ed25519_keypair_t{};
  auto public_size = keypair.public_key.size();
  auto private_size = keypair.private_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key.data(),
                                  &public_size) != 1 ||
      EVP_PKEY_get_raw_private_key(pkey.get(), keypair.private_key.data(),
                                   &private_size) != 1) {
    return std::nullopt;
  }
  return keypair;
}

std::optional<warden::schema::ed25519_signature_t> sign(
    const warden::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    return std::nullopt;
  }

  auto signature = warden::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

sha256_digest_t sha256(const warden::schema::bytes_view_t& data) {
  auto digest = sha256_digest_t{};
  SHA256(data.data(), data.size(), digest.data());
  return digest;
}

warden::schema::bytes_t random_bytes(const std::size_t count) {
  auto out = warden::schema::bytes_t(count);
  if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    warden::common::critical("OpenSSL RAND_bytes failed");
  }
  return out;
}

std::string random_hex(const std::size_t count) {
  auto bytes = random_bytes(count);
  return warden::schema::to_hex(warden::schema::make_bytes_view(bytes));
}

std::string derive_agent_id(
    const warden::schema::ed25519_public_key_t& public_key) {
  auto digest = sha256(warden::schema::bytes_view_t{public_key});
  return "agent_" + warden::schema::to_hex(warden::schema::bytes_view_t{digest});
}

}  // namespace warden::crypto
