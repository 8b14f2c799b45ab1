/* File: asn_error.cpp
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

#include "asn_error.hpp"

namespace asnsig::asn {

const char *ErrorCodeStr(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::kTruncatedHeader:
    return "truncated header";
  case ErrorCode::kUnsupportedLongFormTag:
    return "long form tag is not supported";
  case ErrorCode::kIndefiniteLengthUnsupported:
    return "indefinite length is not supported";
  case ErrorCode::kTruncatedLength:
    return "truncated length octets";
  case ErrorCode::kLengthOverflow:
    return "length overflow";
  case ErrorCode::kTruncatedContent:
    return "element extends beyond available data";
  case ErrorCode::kRecursionLimitExceeded:
    return "maximal recursion depth was reached";
  case ErrorCode::kTooManyElements:
    return "maximal number of elements was reached";
  case ErrorCode::kMalformedOid:
    return "malformed object identifier";
  case ErrorCode::kNoSignatureFound:
    return "no valid signature found";
  }
  return "unknown error";
}

AsnError::AsnError(ErrorCode code, const std::string &msg)
  : std::runtime_error(msg), code_(code) {}

AsnError::AsnError(ErrorCode code)
  : std::runtime_error(ErrorCodeStr(code)), code_(code) {}

} // namespace asnsig::asn
