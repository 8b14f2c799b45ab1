/* File: signature_locator.cpp
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

#include "signature_locator.hpp"

#include <cstdint>
#include <optional>
#include <utility>

#include "asn1.hpp"
#include "asn_error.hpp"
#include "field_extractor.hpp"
#include "logger_utils.hpp"

namespace asnsig::asn {

SignatureMatch::SignatureMatch(uint64_t offset, BytesView full_bytes,
                               ValidationResult validation)
  : offset_(offset),
    full_bytes_(full_bytes),
    validation_(std::move(validation)) {}

SignatureLocator::SignatureLocator(BytesView buffer)
  : buffer_(buffer), logger_(logger::InitLog()) {}

SignatureMatch SignatureLocator::Locate() const {
  auto res = Find();
  if (!res) {
    throw AsnError(ErrorCode::kNoSignatureFound);
  }
  return std::move(res.value());
}

std::optional<SignatureMatch> SignatureLocator::Find() const {
  if (buffer_.size() < kSignatureMarker.size()) {
    return std::nullopt;
  }
  // scan backward, the signature is appended to the end of a file
  for (uint64_t i = buffer_.size() - kSignatureMarker.size();; --i) {
    if (buffer_[i] == kSignatureMarker[0] &&
        buffer_[i + 1] == kSignatureMarker[1]) {
      auto res = TryCandidate(i);
      if (res) {
        if (logger_) {
          logger_->debug("[SignatureLocator] accepted candidate at {}", i);
        }
        return res;
      }
    }
    if (i == 0) {
      break;
    }
  }
  if (logger_) {
    logger_->debug("[SignatureLocator] no candidate was accepted");
  }
  return std::nullopt;
}

std::optional<SignatureMatch>
SignatureLocator::TryCandidate(uint64_t offset) const {
  DecodedElement decoded;
  try {
    decoded = DecodeElement(buffer_.Tail(offset), 0, offset);
  } catch (const AsnError &ex) {
    if (logger_) {
      logger_->trace("[SignatureLocator] candidate at {} rejected: {}", offset,
                     ex.what());
    }
    return std::nullopt;
  }
  const BytesView full_bytes = buffer_.SubView(offset, decoded.bytes_consumed);
  ValidationResult validation = ExtractFields(full_bytes);
  if (!validation.IsValid()) {
    if (logger_) {
      logger_->trace(
        "[SignatureLocator] candidate at {} rejected: missing attributes",
        offset);
    }
    return std::nullopt;
  }
  return SignatureMatch(offset, full_bytes, std::move(validation));
}

SignatureMatch LocateSignature(BytesView buffer) {
  return SignatureLocator(buffer).Locate();
}

} // namespace asnsig::asn
