/* File: signature_locator.hpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#pragma once

#include "field_extractor.hpp"
#include "typedefs.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <spdlog/logger.h>

namespace asnsig::asn {

/// @brief SEQUENCE with a two-octet long form length
constexpr std::array<unsigned char, 2> kSignatureMarker{0x30, 0x82};

/**
 * @brief A located and validated signature structure
 * @details Created by SignatureLocator only, immutable.
 */
class SignatureMatch {
 public:
  /// @brief position of the first byte in the searched buffer
  [[nodiscard]] uint64_t Offset() const noexcept { return offset_; }
  /// @brief header and content bytes, borrowed from the searched buffer
  [[nodiscard]] BytesView FullBytes() const noexcept { return full_bytes_; }
  [[nodiscard]] const ValidationResult &Validation() const noexcept {
    return validation_;
  }

 private:
  friend class SignatureLocator;
  SignatureMatch(uint64_t offset, BytesView full_bytes,
                 ValidationResult validation);

  uint64_t offset_ = 0;
  BytesView full_bytes_;
  ValidationResult validation_;
};

/**
 * @brief Backward search for a signature appended to a file
 * @details Scans from the end of the buffer for kSignatureMarker. A candidate
 * is accepted if it decodes and carries all the signer's attributes. The
 * rightmost acceptable candidate wins, which is a heuristic: a file with
 * several plausible structures yields the last one.
 */
class SignatureLocator {
 public:
  explicit SignatureLocator(BytesView buffer);

  /**
   * @brief Find the signature
   * @return SignatureMatch
   * @throws AsnError with ErrorCode::kNoSignatureFound
   */
  [[nodiscard]] SignatureMatch Locate() const;

  /**
   * @brief Find the signature
   * @return nullopt if no candidate is accepted
   * @throws std::bad_alloc
   */
  [[nodiscard]] std::optional<SignatureMatch> Find() const;

 private:
  /// @brief decode and validate the structure starting at offset
  [[nodiscard]] std::optional<SignatureMatch>
  TryCandidate(uint64_t offset) const;

  BytesView buffer_;
  std::shared_ptr<spdlog::logger> logger_;
};

/// @brief shortcut for SignatureLocator(buffer).Locate()
/// @throws AsnError
[[nodiscard]] SignatureMatch LocateSignature(BytesView buffer);

} // namespace asnsig::asn
