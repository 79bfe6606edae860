#include "wscore/compression.hpp"

#include <catch2/catch.hpp>
#include <string>
#include <vector>

using namespace wscore;

namespace {

CompressionConfig enabled_config() {
  CompressionConfig cfg;
  cfg.enabled = true;
  return cfg;
}

std::vector<uint8_t> as_bytes(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

std::string as_string(const std::vector<uint8_t>& v) {
  return std::string(v.begin(), v.end());
}

}  // namespace

TEST_CASE("Deflate - RFC 7692 example payload", "[compression]") {
  PerMessageDeflate pmd(enabled_config(), 1 << 20);
  const std::string hello = "Hello";
  auto out = pmd.compress(reinterpret_cast<const uint8_t*>(hello.data()), hello.size());
  REQUIRE(out.has_value());
  std::vector<uint8_t> want = {0xf2, 0x48, 0xcd, 0xc9, 0xc9, 0x07, 0x00};
  REQUIRE(out.value() == want);

  auto back = pmd.decompress(want.data(), want.size());
  REQUIRE(back.has_value());
  REQUIRE(as_string(back.value()) == "Hello");
}

TEST_CASE("Deflate - context takeover shrinks repeated messages", "[compression]") {
  PerMessageDeflate sender(enabled_config(), 1 << 20);
  PerMessageDeflate receiver(enabled_config(), 1 << 20);

  auto msg = as_bytes(std::string(200, 'a') + "the same sentence every time");
  auto first = sender.compress(msg.data(), msg.size());
  auto second = sender.compress(msg.data(), msg.size());
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  REQUIRE(second.value().size() < first.value().size());

  // The receiver must see the messages in order.
  auto a = receiver.decompress(first.value().data(), first.value().size());
  auto b = receiver.decompress(second.value().data(), second.value().size());
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a.value() == msg);
  REQUIRE(b.value() == msg);
}

TEST_CASE("Deflate - no context takeover makes messages independent", "[compression]") {
  auto cfg = enabled_config();
  cfg.context_takeover = false;
  PerMessageDeflate sender(cfg, 1 << 20);

  auto msg = as_bytes("independent message independent message");
  auto first = sender.compress(msg.data(), msg.size());
  auto second = sender.compress(msg.data(), msg.size());
  REQUIRE(first.value() == second.value());

  // A fresh inflater can read the second one on its own.
  auto peer_cfg = enabled_config();
  peer_cfg.peer_context_takeover = false;
  PerMessageDeflate receiver(peer_cfg, 1 << 20);
  auto out = receiver.decompress(second.value().data(), second.value().size());
  REQUIRE(out.has_value());
  REQUIRE(out.value() == msg);
}

TEST_CASE("Deflate - small window is readable by the default inflater", "[compression]") {
  auto cfg = enabled_config();
  cfg.window_bits = 9;
  PerMessageDeflate sender(cfg, 1 << 20);
  PerMessageDeflate receiver(enabled_config(), 1 << 20);

  std::string text;
  for (int i = 0; i < 100; ++i) text += "line " + std::to_string(i) + "\n";
  auto msg = as_bytes(text);
  auto c = sender.compress(msg.data(), msg.size());
  REQUIRE(c.has_value());
  auto d = receiver.decompress(c.value().data(), c.value().size());
  REQUIRE(d.has_value());
  REQUIRE(d.value() == msg);
}

TEST_CASE("Deflate - empty message", "[compression]") {
  PerMessageDeflate pmd(enabled_config(), 1 << 20);
  auto c = pmd.compress(nullptr, 0);
  REQUIRE(c.has_value());
  REQUIRE_FALSE(c.value().empty());
  auto d = pmd.decompress(c.value().data(), c.value().size());
  REQUIRE(d.has_value());
  REQUIRE(d.value().empty());
}

TEST_CASE("Deflate - output over the ceiling is rejected", "[compression]") {
  PerMessageDeflate sender(enabled_config(), 0);
  PerMessageDeflate receiver(enabled_config(), 1024);

  std::vector<uint8_t> big(64 * 1024, 'z');
  auto c = sender.compress(big.data(), big.size());
  REQUIRE(c.has_value());
  REQUIRE(c.value().size() < 1024);

  auto d = receiver.decompress(c.value().data(), c.value().size());
  REQUIRE_FALSE(d.has_value());
  REQUIRE(d.get_error() == ErrorCode::kCompressionError);
}

TEST_CASE("Deflate - corrupt input", "[compression]") {
  PerMessageDeflate pmd(enabled_config(), 1 << 20);
  // Block type 11 is reserved in deflate.
  std::vector<uint8_t> junk = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
  auto d = pmd.decompress(junk.data(), junk.size());
  REQUIRE_FALSE(d.has_value());
  REQUIRE(d.get_error() == ErrorCode::kCompressionError);
}
