/* File: asn_error.hpp
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

#include <cstdint>
#include <stdexcept>
#include <string>

namespace asnsig::asn {

enum class ErrorCode : uint8_t {
  // header decoding
  kTruncatedHeader,
  kUnsupportedLongFormTag,
  kIndefiniteLengthUnsupported,
  kTruncatedLength,
  kLengthOverflow,
  kTruncatedContent,
  // tree walking
  kRecursionLimitExceeded,
  kTooManyElements,
  // OBJECT IDENTIFIER
  kMalformedOid,
  // signature search
  kNoSignatureFound
};

[[nodiscard]] const char *ErrorCodeStr(ErrorCode code) noexcept;

/**
 * @brief Recoverable decoding error
 * @details The code tells what exactly went wrong, what() contains a
 * human-readable explanation.
 */
class AsnError : public std::runtime_error {
 public:
  AsnError(ErrorCode code, const std::string &msg);
  explicit AsnError(ErrorCode code);

  [[nodiscard]] ErrorCode Code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

} // namespace asnsig::asn
