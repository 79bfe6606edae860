#include "wscore/compression.hpp"

#include "wscore/log.hpp"

#include <algorithm>
#include <string>

namespace wscore {

namespace {

constexpr size_t kChunkSize = 16 * 1024;
constexpr uint8_t kDeflateTail[4] = {0x00, 0x00, 0xFF, 0xFF};

using BytesResult = expected<std::vector<uint8_t>, ErrorCode>;

int deflater_window_bits(uint8_t bits) {
  // zlib refuses 8 for raw deflate; a 9-bit window is readable by an
  // 8-bit inflater.
  return bits == 8 ? -9 : -static_cast<int>(bits);
}

}  // namespace

// ============================================================================
// ZlibStream
// ============================================================================

ZlibStream::ZlibStream(Mode mode, int window_bits, int level) : mode_(mode) {
  int rc = Z_OK;
  if (mode_ == Mode::kDeflate) {
    rc = deflateInit2(&stream_, level, Z_DEFLATED, window_bits, 8,
                      Z_DEFAULT_STRATEGY);
  } else {
    rc = inflateInit2(&stream_, window_bits);
  }
  initialized_ = (rc == Z_OK);
  if (!initialized_) {
    WSCORE_LOG_ERROR("zlib stream init failed: " + std::to_string(rc));
  }
}

ZlibStream::~ZlibStream() {
  if (!initialized_) return;
  if (mode_ == Mode::kDeflate) {
    deflateEnd(&stream_);
  } else {
    inflateEnd(&stream_);
  }
}

expected<void, ErrorCode> ZlibStream::process(const uint8_t* input, size_t len,
                                              std::vector<uint8_t>& out,
                                              size_t max_out) {
  if (!initialized_) {
    return expected<void, ErrorCode>::error(ErrorCode::kCompressionError);
  }

  stream_.next_in = const_cast<Bytef*>(input);
  stream_.avail_in = static_cast<uInt>(len);

  uint8_t chunk[kChunkSize];
  for (;;) {
    stream_.next_out = chunk;
    stream_.avail_out = kChunkSize;

    int rc = (mode_ == Mode::kDeflate) ? deflate(&stream_, Z_SYNC_FLUSH)
                                       : inflate(&stream_, Z_SYNC_FLUSH);
    if (rc != Z_OK && rc != Z_BUF_ERROR && rc != Z_STREAM_END) {
      return expected<void, ErrorCode>::error(ErrorCode::kCompressionError);
    }

    const size_t produced = kChunkSize - stream_.avail_out;
    out.insert(out.end(), chunk, chunk + produced);
    if (max_out != 0 && out.size() > max_out) {
      return expected<void, ErrorCode>::error(ErrorCode::kCompressionError);
    }

    if (rc == Z_STREAM_END) {
      // The peer closed its deflate stream; the next message starts fresh.
      return reset();
    }
    if (stream_.avail_in == 0 && stream_.avail_out != 0) break;
    if (rc == Z_BUF_ERROR && produced == 0) {
      // No progress with input left over: truncated or corrupt stream.
      return expected<void, ErrorCode>::error(ErrorCode::kCompressionError);
    }
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> ZlibStream::reset() {
  int rc = (mode_ == Mode::kDeflate) ? deflateReset(&stream_) : inflateReset(&stream_);
  if (rc != Z_OK) {
    return expected<void, ErrorCode>::error(ErrorCode::kCompressionError);
  }
  return expected<void, ErrorCode>::success();
}

// ============================================================================
// PerMessageDeflate
// ============================================================================

PerMessageDeflate::PerMessageDeflate(const CompressionConfig& config,
                                     size_t max_decompressed)
    : config_(config),
      max_decompressed_(max_decompressed),
      deflater_(ZlibStream::Mode::kDeflate, deflater_window_bits(config.window_bits),
                config.level),
      inflater_(ZlibStream::Mode::kInflate, -15, config.level) {}

BytesResult PerMessageDeflate::compress(const uint8_t* data, size_t len) {
  std::vector<uint8_t> out;
  out.reserve(len / 2 + 16);
  auto r = deflater_.process(data, len, out, 0);
  if (!r) return BytesResult::error(r.get_error());

  if (out.size() >= 4 && std::equal(out.end() - 4, out.end(), kDeflateTail)) {
    out.resize(out.size() - 4);
  }
  if (out.empty()) {
    // An empty deflate block; a bare empty payload would not inflate.
    out.push_back(0x00);
  }

  if (!config_.context_takeover) {
    auto rr = deflater_.reset();
    if (!rr) return BytesResult::error(rr.get_error());
  }
  return BytesResult::success(std::move(out));
}

BytesResult PerMessageDeflate::decompress(const uint8_t* data, size_t len) {
  std::vector<uint8_t> input;
  input.reserve(len + 4);
  input.insert(input.end(), data, data + len);
  input.insert(input.end(), kDeflateTail, kDeflateTail + 4);

  std::vector<uint8_t> out;
  auto r = inflater_.process(input.data(), input.size(), out, max_decompressed_);
  if (!r) {
    WSCORE_LOG_WARN("permessage-deflate: inflate failed");
    return BytesResult::error(r.get_error());
  }

  if (!config_.peer_context_takeover) {
    auto rr = inflater_.reset();
    if (!rr) return BytesResult::error(rr.get_error());
  }
  return BytesResult::success(std::move(out));
}

}  // namespace wscore
