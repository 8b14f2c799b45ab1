#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace asnsig::asn {

using BytesVector = std::vector<unsigned char>;

/**
 * @brief A borrowed, read-only window over bytes owned by someone else
 * @details Never copies the underlying data, the owner must outlive the
 * view.
 */
class BytesView {
 public:
  BytesView() = default;
  BytesView(const unsigned char *ptr_data, uint64_t size) noexcept
    : data_(ptr_data), size_(ptr_data == nullptr ? 0 : size) {}
  explicit BytesView(const BytesVector &vec) noexcept
    : data_(vec.data()), size_(vec.size()) {}

  [[nodiscard]] const unsigned char *data() const noexcept { return data_; }
  [[nodiscard]] uint64_t size() const noexcept { return size_; }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
  [[nodiscard]] const unsigned char *begin() const noexcept { return data_; }
  [[nodiscard]] const unsigned char *end() const noexcept {
    return data_ + size_;
  }

  /// @brief unchecked access
  unsigned char operator[](uint64_t index) const noexcept {
    return data_[index];
  }

  /**
   * @brief Get a part of this view
   * @param pos start position
   * @param count number of bytes
   * @throws std::out_of_range if [pos,pos+count) is not inside the view
   */
  [[nodiscard]] BytesView SubView(uint64_t pos, uint64_t count) const {
    if (pos > size_ || count > size_ - pos) {
      throw std::out_of_range("[BytesView::SubView] range is out of bounds");
    }
    return {data_ + pos, count};
  }

  /// @brief everything starting from pos
  /// @throws std::out_of_range
  [[nodiscard]] BytesView Tail(uint64_t pos) const {
    if (pos > size_) {
      throw std::out_of_range("[BytesView::Tail] position is out of bounds");
    }
    return {data_ + pos, size_ - pos};
  }

  [[nodiscard]] BytesVector ToVector() const {
    return empty() ? BytesVector{} : BytesVector(begin(), end());
  }

  [[nodiscard]] std::string ToString() const {
    return empty() ? std::string{} : std::string(begin(), end());
  }

 private:
  const unsigned char *data_ = nullptr;
  uint64_t size_ = 0;
};

} // namespace asnsig::asn
