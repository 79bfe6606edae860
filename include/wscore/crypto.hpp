#ifndef WSCORE_CRYPTO_HPP_
#define WSCORE_CRYPTO_HPP_

#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace wscore {

// ============================================================================
// Base64 encoding/decoding
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size) {
    static constexpr const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve((size + 2) / 3 * 4);

    for (size_t i = 0; i < size; i += 3) {
      uint32_t b = (static_cast<uint32_t>(data[i]) << 16);
      if (i + 1 < size) b |= (static_cast<uint32_t>(data[i + 1]) << 8);
      if (i + 2 < size) b |= static_cast<uint32_t>(data[i + 2]);

      result.push_back(kAlphabet[(b >> 18) & 0x3F]);
      result.push_back(kAlphabet[(b >> 12) & 0x3F]);
      result.push_back(i + 1 < size ? kAlphabet[(b >> 6) & 0x3F] : '=');
      result.push_back(i + 2 < size ? kAlphabet[b & 0x3F] : '=');
    }
    return result;
  }

  // Strict decoder: rejects characters outside the alphabet and misplaced
  // padding instead of silently mapping them to zero bits.
  static expected<std::vector<uint8_t>, ErrorCode> decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) {
      return expected<std::vector<uint8_t>, ErrorCode>::error(
          ErrorCode::kInvalidArgument);
    }

    std::vector<uint8_t> result;
    result.reserve(encoded.size() / 4 * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
      const bool last = (i + 4 == encoded.size());
      int v[4];
      size_t pad = 0;
      for (size_t j = 0; j < 4; ++j) {
        char c = encoded[i + j];
        if (c == '=' && last && j >= 2) {
          v[j] = 0;
          ++pad;
          continue;
        }
        if (pad != 0) {
          return expected<std::vector<uint8_t>, ErrorCode>::error(
              ErrorCode::kInvalidArgument);
        }
        v[j] = value_of(c);
        if (v[j] < 0) {
          return expected<std::vector<uint8_t>, ErrorCode>::error(
              ErrorCode::kInvalidArgument);
        }
      }

      uint32_t b = (static_cast<uint32_t>(v[0]) << 18) |
                   (static_cast<uint32_t>(v[1]) << 12) |
                   (static_cast<uint32_t>(v[2]) << 6) | static_cast<uint32_t>(v[3]);
      result.push_back(static_cast<uint8_t>((b >> 16) & 0xFF));
      if (pad < 2) result.push_back(static_cast<uint8_t>((b >> 8) & 0xFF));
      if (pad < 1) result.push_back(static_cast<uint8_t>(b & 0xFF));
    }
    return expected<std::vector<uint8_t>, ErrorCode>::success(std::move(result));
  }

 private:
  static int value_of(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
  }
};

// ============================================================================
// SHA-1 hashing (for WebSocket accept key generation)
// ============================================================================

class SHA1 {
 public:
  static std::array<uint8_t, 20> compute(const uint8_t* data, size_t size) {
    SHA1 sha1;
    sha1.update(data, size);
    return sha1.finalize();
  }

  static std::string hex_digest(std::string_view input) {
    auto hash = compute(reinterpret_cast<const uint8_t*>(input.data()),
                        input.size());
    std::string result;
    result.reserve(40);
    for (auto byte : hash) {
      result += "0123456789abcdef"[byte >> 4];
      result += "0123456789abcdef"[byte & 0x0f];
    }
    return result;
  }

  void update(const uint8_t* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
      buffer_[buf_pos_++] = data[i];
      ++total_bytes_;
      if (buf_pos_ == 64) {
        process_block(buffer_.data());
        buf_pos_ = 0;
      }
    }
  }

  std::array<uint8_t, 20> finalize() {
    buffer_[buf_pos_++] = 0x80;
    if (buf_pos_ > 56) {
      while (buf_pos_ < 64) buffer_[buf_pos_++] = 0;
      process_block(buffer_.data());
      buf_pos_ = 0;
    }
    while (buf_pos_ < 56) buffer_[buf_pos_++] = 0;

    uint64_t total_bits = total_bytes_ * 8;
    for (int i = 0; i < 8; ++i) {
      buffer_[56 + i] = static_cast<uint8_t>((total_bits >> (8 * (7 - i))) & 0xFF);
    }
    process_block(buffer_.data());

    std::array<uint8_t, 20> result;
    for (int i = 0; i < 5; ++i) {
      result[i * 4] = static_cast<uint8_t>((h_[i] >> 24) & 0xFF);
      result[i * 4 + 1] = static_cast<uint8_t>((h_[i] >> 16) & 0xFF);
      result[i * 4 + 2] = static_cast<uint8_t>((h_[i] >> 8) & 0xFF);
      result[i * 4 + 3] = static_cast<uint8_t>(h_[i] & 0xFF);
    }
    return result;
  }

 private:
  std::array<uint32_t, 5> h_ = {0x67452301, 0xEFCDAB89, 0x98BADCFE,
                                 0x10325476, 0xC3D2E1F0};
  std::array<uint8_t, 64> buffer_{};
  uint32_t buf_pos_ = 0;
  uint64_t total_bytes_ = 0;

  static uint32_t rol(uint32_t x, int n) { return (x << n) | (x >> (32 - n)); }

  void process_block(const uint8_t* block) {
    std::array<uint32_t, 80> w;
    for (int i = 0; i < 16; ++i) {
      w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
             (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
             (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
             static_cast<uint32_t>(block[i * 4 + 3]);
    }
    for (int i = 16; i < 80; ++i) {
      w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3], e = h_[4];
    for (int i = 0; i < 80; ++i) {
      uint32_t f = 0, k = 0;
      if (i < 20) {
        f = (b & c) | ((~b) & d);
        k = 0x5A827999;
      } else if (i < 40) {
        f = b ^ c ^ d;
        k = 0x6ED9EBA1;
      } else if (i < 60) {
        f = (b & c) | (b & d) | (c & d);
        k = 0x8F1BBCDC;
      } else {
        f = b ^ c ^ d;
        k = 0xCA62C1D6;
      }
      uint32_t temp = rol(a, 5) + f + e + k + w[i];
      e = d;
      d = c;
      c = rol(b, 30);
      b = a;
      a = temp;
    }

    h_[0] += a;
    h_[1] += b;
    h_[2] += c;
    h_[3] += d;
    h_[4] += e;
  }
};

}  // namespace wscore

#endif  // WSCORE_CRYPTO_HPP_
