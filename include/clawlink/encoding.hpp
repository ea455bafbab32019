#pragma once

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace clawlink {

using bytes = std::vector<uint8_t>;

inline bytes to_bytes(std::string_view text) {
  return bytes(text.begin(), text.end());
}

inline std::string to_hex(const uint8_t *data, size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

inline std::string to_hex(const bytes &data) {
  return to_hex(data.data(), data.size());
}

inline bytes sha256(const uint8_t *data, size_t size) {
  bytes digest(SHA256_DIGEST_LENGTH);
  if (EVP_Digest(data, size, digest.data(), nullptr, EVP_sha256(), nullptr) !=
      1) {
    throw std::runtime_error("sha256 digest failed");
  }
  return digest;
}

inline bytes sha256(const bytes &data) {
  return sha256(data.data(), data.size());
}

/// Standard base64 with padding (RFC 4648 section 4).
inline std::string base64_encode(const uint8_t *data, size_t size) {
  if (size == 0)
    return "";
  std::string out(4 * ((size + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data,
                          static_cast<int>(size));
  out.resize(static_cast<size_t>(n));
  return out;
}

inline std::string base64_encode(const bytes &data) {
  return base64_encode(data.data(), data.size());
}

/// URL-safe base64 without padding (RFC 4648 section 5).
inline std::string base64url_encode(const uint8_t *data, size_t size) {
  std::string out = base64_encode(data, size);
  while (!out.empty() && out.back() == '=')
    out.pop_back();
  for (auto &c : out) {
    if (c == '+')
      c = '-';
    else if (c == '/')
      c = '_';
  }
  return out;
}

inline std::string base64url_encode(const bytes &data) {
  return base64url_encode(data.data(), data.size());
}

inline bytes base64url_decode(std::string_view text) {
  std::string std_text(text);
  for (auto &c : std_text) {
    if (c == '-')
      c = '+';
    else if (c == '_')
      c = '/';
  }
  if (std_text.size() % 4 == 1)
    throw std::invalid_argument("invalid base64url length");
  size_t padding = (4 - std_text.size() % 4) % 4;
  std_text.append(padding, '=');

  bytes out(3 * std_text.size() / 4);
  int n = EVP_DecodeBlock(out.data(),
                          reinterpret_cast<const unsigned char *>(
                              std_text.data()),
                          static_cast<int>(std_text.size()));
  if (n < 0)
    throw std::invalid_argument("invalid base64url text");
  // EVP_DecodeBlock counts the zero bytes produced by the padding.
  out.resize(static_cast<size_t>(n) - padding);
  return out;
}

/// Random RFC 4122 version 4 identifier.
inline std::string generate_uuid() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  uint8_t raw[16];
  for (size_t i = 0; i < sizeof(raw); i += 8) {
    uint64_t v = rng();
    for (size_t j = 0; j < 8; ++j)
      raw[i + j] = static_cast<uint8_t>(v >> (j * 8));
  }
  raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);
  raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);

  std::string hex = to_hex(raw, sizeof(raw));
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}

} // namespace clawlink
