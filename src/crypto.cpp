#include "nexus/crypto.hpp"

#include <algorithm>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace nexus::crypto {
namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};
struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

PkeyPtr private_key_from_seed(const Key32& seed) {
  return PkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
}

PkeyPtr public_key_from_bytes(const Key32& pk) {
  return PkeyPtr(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pk.data(), pk.size()));
}

}  // namespace

bool random_bytes(std::uint8_t* out, std::size_t len) {
  if (len == 0) return true;
  return RAND_bytes(out, static_cast<int>(len)) == 1;
}

std::string random_string(std::size_t len) {
  std::string out(len, '\0');
  if (!random_bytes(reinterpret_cast<std::uint8_t*>(out.data()), len)) return {};
  return out;
}

void secure_zero(void* ptr, std::size_t len) {
  OPENSSL_cleanse(ptr, len);
}

SigningKey::~SigningKey() {
  secure_zero(seed_.data(), seed_.size());
}

std::optional<SigningKey> SigningKey::generate() {
  Key32 seed{};
  if (!random_bytes(seed.data(), seed.size())) return std::nullopt;
  SigningKey key(seed);
  secure_zero(seed.data(), seed.size());
  return key;
}

std::optional<Key32> SigningKey::public_key() const {
  auto pkey = private_key_from_seed(seed_);
  if (!pkey) return std::nullopt;
  Key32 out{};
  size_t len = out.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), out.data(), &len) != 1 || len != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::string SigningKey::sign(std::string_view message) const {
  auto pkey = private_key_from_seed(seed_);
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!pkey || !ctx) return {};
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) return {};
  std::string sig(kEd25519SignatureLen, '\0');
  size_t sig_len = sig.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(sig.data()), &sig_len,
                     reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
    return {};
  }
  sig.resize(sig_len);
  return sig;
}

bool ed25519_public_key_valid(const Key32& public_key) {
  return static_cast<bool>(public_key_from_bytes(public_key));
}

bool ed25519_verify(const Key32& public_key, std::string_view message, std::string_view signature) {
  if (signature.size() != kEd25519SignatureLen) return false;
  auto pkey = public_key_from_bytes(public_key);
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!pkey || !ctx) return false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) return false;
  return EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
                          reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1;
}

std::optional<std::string> aes256gcm_seal(const Key32& key, const std::array<std::uint8_t, kAesGcmNonceLen>& nonce,
                                          std::string_view plaintext) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) return std::nullopt;
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) return std::nullopt;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kAesGcmNonceLen), nullptr) != 1) {
    return std::nullopt;
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) return std::nullopt;

  std::string out(plaintext.size() + kAesGcmTagLen, '\0');
  auto* out_ptr = reinterpret_cast<unsigned char*>(out.data());
  int outlen = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), out_ptr, &outlen, reinterpret_cast<const unsigned char*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    return std::nullopt;
  }
  int finlen = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), out_ptr + outlen, &finlen) != 1) return std::nullopt;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAesGcmTagLen),
                          out_ptr + plaintext.size()) != 1) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::string> aes256gcm_open(const Key32& key, const std::array<std::uint8_t, kAesGcmNonceLen>& nonce,
                                          std::string_view ciphertext_and_tag) {
  if (ciphertext_and_tag.size() < kAesGcmTagLen) return std::nullopt;
  const size_t ct_len = ciphertext_and_tag.size() - kAesGcmTagLen;
  const auto* ct = reinterpret_cast<const unsigned char*>(ciphertext_and_tag.data());

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) return std::nullopt;
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) return std::nullopt;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kAesGcmNonceLen), nullptr) != 1) {
    return std::nullopt;
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) return std::nullopt;

  std::string plain(ct_len, '\0');
  auto* plain_ptr = reinterpret_cast<unsigned char*>(plain.data());
  int outlen = 0;
  if (ct_len > 0 && EVP_DecryptUpdate(ctx.get(), plain_ptr, &outlen, ct, static_cast<int>(ct_len)) != 1) {
    return std::nullopt;
  }
  std::array<unsigned char, kAesGcmTagLen> tag{};
  std::copy(ct + ct_len, ct + ct_len + kAesGcmTagLen, tag.begin());
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kAesGcmTagLen), tag.data()) != 1) {
    return std::nullopt;
  }
  int finlen = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), plain_ptr + outlen, &finlen) != 1) {
    secure_zero(plain.data(), plain.size());
    return std::nullopt;
  }
  return plain;
}

}  // namespace nexus::crypto
