#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include <openssl/evp.h>
#include <openssl/pem.h>

#include "encoding.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace clawlink {

constexpr size_t kEd25519KeySize = 32;
constexpr size_t kEd25519SignatureSize = 64;

struct pkey_deleter {
  void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
};
struct md_ctx_deleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
struct pkey_ctx_deleter {
  void operator()(EVP_PKEY_CTX *ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using pkey_ptr = std::unique_ptr<EVP_PKEY, pkey_deleter>;
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;
using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter>;

/// Device id: lowercase hex SHA-256 of the raw 32-byte public key.
inline std::string derive_device_id(const bytes &raw_public_key) {
  return to_hex(sha256(raw_public_key));
}

/// Fields of the string signed during the connect handshake.
struct auth_payload_fields {
  std::string device_id;
  std::string client_id;
  std::string client_mode;
  std::string role;
  std::vector<std::string> scopes;
  int64_t signed_at_ms = 0;
  std::optional<std::string> token;
  std::optional<std::string> nonce;
};

/// version|deviceId|clientId|clientMode|role|scopes|signedAtMs|token[|nonce]
/// "v2" carries the nonce as a ninth field, "v1" omits it entirely.
inline std::string build_auth_payload(const auth_payload_fields &fields) {
  const bool with_nonce = fields.nonce.has_value();
  std::string scopes;
  for (size_t i = 0; i < fields.scopes.size(); ++i) {
    if (i > 0)
      scopes += ",";
    scopes += fields.scopes[i];
  }

  std::string out = with_nonce ? "v2" : "v1";
  out += "|" + fields.device_id;
  out += "|" + fields.client_id;
  out += "|" + fields.client_mode;
  out += "|" + fields.role;
  out += "|" + scopes;
  out += "|" + std::to_string(fields.signed_at_ms);
  out += "|" + fields.token.value_or("");
  if (with_nonce)
    out += "|" + *fields.nonce;
  return out;
}

/// Check an Ed25519 signature (base64url) against a raw public key.
inline bool verify_signature(const bytes &raw_public_key,
                             std::string_view payload,
                             std::string_view signature_b64url) {
  if (raw_public_key.size() != kEd25519KeySize)
    return false;

  bytes signature;
  try {
    signature = base64url_decode(signature_b64url);
  } catch (const std::invalid_argument &) {
    return false;
  }

  pkey_ptr key(EVP_PKEY_new_raw_public_key(
      EVP_PKEY_ED25519, nullptr, raw_public_key.data(), raw_public_key.size()));
  md_ctx_ptr ctx(EVP_MD_CTX_new());
  if (!key || !ctx)
    return false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) !=
      1)
    return false;
  return EVP_DigestVerify(
             ctx.get(), signature.data(), signature.size(),
             reinterpret_cast<const unsigned char *>(payload.data()),
             payload.size()) == 1;
}

/// Long-lived Ed25519 signing identity of this installation.
class device_identity {
public:
  explicit device_identity(pkey_ptr key) : key_(std::move(key)) {
    if (!key_ || EVP_PKEY_id(key_.get()) != EVP_PKEY_ED25519) {
      throw identity_error("device key is not an Ed25519 private key");
    }
    size_t len = kEd25519KeySize;
    public_key_.resize(len);
    if (EVP_PKEY_get_raw_public_key(key_.get(), public_key_.data(), &len) !=
            1 ||
        len != kEd25519KeySize) {
      throw identity_error("cannot extract raw Ed25519 public key");
    }
    device_id_ = derive_device_id(public_key_);
  }

  static device_identity generate() {
    pkey_ctx_ptr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
      throw identity_error("Ed25519 keygen init failed");
    }
    EVP_PKEY *raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      throw identity_error("Ed25519 keygen failed");
    }
    return device_identity(pkey_ptr(raw));
  }

  static device_identity from_seed(const bytes &seed) {
    if (seed.size() != kEd25519KeySize) {
      throw identity_error("Ed25519 seed must be 32 bytes");
    }
    pkey_ptr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              seed.data(), seed.size()));
    if (!key) {
      throw identity_error("invalid Ed25519 seed");
    }
    return device_identity(std::move(key));
  }

  const std::string &device_id() const { return device_id_; }
  const bytes &public_key() const { return public_key_; }
  std::string public_key_base64url() const {
    return base64url_encode(public_key_);
  }

  /// Sign the exact bytes given. Returns nothing when signing fails; callers
  /// then fall back to token-only auth.
  std::optional<std::string> sign(std::string_view payload) const {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
            1) {
      logger()->error("device signature init failed");
      return std::nullopt;
    }
    bytes signature(kEd25519SignatureSize);
    size_t len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &len,
                       reinterpret_cast<const unsigned char *>(payload.data()),
                       payload.size()) != 1) {
      logger()->error("device signature failed");
      return std::nullopt;
    }
    signature.resize(len);
    return base64url_encode(signature);
  }

  bool verify(std::string_view payload,
              std::string_view signature_b64url) const {
    return verify_signature(public_key_, payload, signature_b64url);
  }

  /// Write the private key as PKCS#8 PEM to a new 0600 file. Refuses to
  /// replace an existing file.
  void save(const std::string &path) const {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
      throw identity_error("cannot create " + path + ": " +
                           std::strerror(errno));
    }
    FILE *file = ::fdopen(fd, "w");
    if (file == nullptr) {
      ::close(fd);
      throw identity_error("fdopen failed for " + path);
    }
    int ok = PEM_write_PrivateKey(file, key_.get(), nullptr, nullptr, 0,
                                  nullptr, nullptr);
    int closed = std::fclose(file);
    if (ok != 1 || closed != 0) {
      ::unlink(path.c_str());
      throw identity_error("cannot write device key to " + path);
    }
  }

  static device_identity load(const std::string &path) {
    FILE *file = std::fopen(path.c_str(), "r");
    if (file == nullptr) {
      throw identity_error("cannot open " + path + ": " +
                           std::strerror(errno));
    }
    EVP_PKEY *raw = PEM_read_PrivateKey(file, nullptr, nullptr, nullptr);
    std::fclose(file);
    if (raw == nullptr) {
      throw identity_error(path + ": not a PEM private key");
    }
    return device_identity(pkey_ptr(raw));
  }

private:
  pkey_ptr key_;
  bytes public_key_;
  std::string device_id_;
};

/// Loads the installation's identity, generating it on first use.
class device_identity_store {
public:
  explicit device_identity_store(std::string path) : path_(std::move(path)) {}

  /// Idempotent. An existing key file is always loaded, never replaced; an
  /// unreadable one raises identity_error.
  std::shared_ptr<const device_identity> load_or_create() {
    std::lock_guard<std::mutex> lock(mu_);
    if (cached_)
      return cached_;

    struct stat st {};
    if (::stat(path_.c_str(), &st) == 0) {
      cached_ = std::make_shared<device_identity>(device_identity::load(path_));
      logger()->debug("loaded device identity {}", cached_->device_id());
      return cached_;
    }
    if (errno != ENOENT) {
      throw identity_error("cannot stat " + path_ + ": " +
                           std::strerror(errno));
    }

    auto created = device_identity::generate();
    created.save(path_);
    cached_ = std::make_shared<device_identity>(std::move(created));
    logger()->info("created device identity {}", cached_->device_id());
    return cached_;
  }

  const std::string &path() const { return path_; }

private:
  std::string path_;
  std::mutex mu_;
  std::shared_ptr<const device_identity> cached_;
};

} // namespace clawlink
