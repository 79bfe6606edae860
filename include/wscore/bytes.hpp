#ifndef WSCORE_BYTES_HPP_
#define WSCORE_BYTES_HPP_

#include <cstdint>
#include <cstring>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace wscore {

class Bytes {
 public:
  Bytes() = default;

  explicit Bytes(std::vector<uint8_t> owned)
      : storage_(std::make_shared<const std::vector<uint8_t>>(std::move(owned))),
        offset_(0),
        size_(storage_->size()) {}

  static Bytes copy_from(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    return Bytes(std::vector<uint8_t>(p, p + len));
  }

  static Bytes from_string(std::string_view s) {
    return copy_from(s.data(), s.size());
  }

  /// Sub-range sharing this storage. Out-of-range requests are clamped.
  Bytes slice(size_t offset, size_t len) const {
    Bytes out;
    if (offset > size_) offset = size_;
    if (len > size_ - offset) len = size_ - offset;
    out.storage_ = storage_;
    out.offset_ = offset_ + offset;
    out.size_ = len;
    return out;
  }

  Bytes slice(size_t offset) const {
    return slice(offset, size_ > offset ? size_ - offset : 0);
  }

  const uint8_t* data() const {
    return storage_ ? storage_->data() + offset_ : nullptr;
  }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  uint8_t operator[](size_t i) const { return data()[i]; }

  const uint8_t* begin() const { return data(); }
  const uint8_t* end() const { return data() + size_; }

  std::string_view as_string_view() const {
    return std::string_view(reinterpret_cast<const char*>(data()), size_);
  }

  std::string to_string() const { return std::string(as_string_view()); }

  std::vector<uint8_t> to_vector() const {
    return std::vector<uint8_t>(begin(), end());
  }

  bool shares_storage_with(const Bytes& other) const {
    return storage_ && storage_ == other.storage_;
  }

  bool operator==(const Bytes& other) const {
    return size_ == other.size_ &&
           (size_ == 0 || std::memcmp(data(), other.data(), size_) == 0);
  }
  bool operator!=(const Bytes& other) const { return !(*this == other); }

 private:
  std::shared_ptr<const std::vector<uint8_t>> storage_;
  size_t offset_{0};
  size_t size_{0};
};

}  // namespace wscore

#endif  // WSCORE_BYTES_HPP_
