/* File: content_formatter.cpp
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

#include "content_formatter.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "asn1.hpp"
#include "oid_table.hpp"
#include "utils.hpp"

namespace asnsig::asn {

namespace {

/// @brief values up to 8 bytes long are printed as numbers
constexpr uint64_t kMaxNumericBytes = 8;

// two's complement big-endian integer, at most 8 bytes
int64_t SignedValue(BytesView content) noexcept {
  uint64_t val = 0;
  for (const auto oct : content) {
    val = (val << 8) | oct;
  }
  if (!content.empty() && content.size() < kMaxNumericBytes &&
      (content[0] & 0x80) != 0) {
    val |= ~uint64_t{0} << (8 * content.size());
  }
  return static_cast<int64_t>(val);
}

} // namespace

std::string TagName(const AsnHeader &header) {
  const std::string number = std::to_string(header.tag_number);
  switch (header.tag_type) {
  case AsnTagType::kApplication:
    return "APPLICATION [" + number + "]";
  case AsnTagType::kContentSpecific:
    return "CONTEXT SPECIFIC [" + number + "]";
  case AsnTagType::kPrivate:
    return "PRIVATE [" + number + "]";
  case AsnTagType::kUniversal:
    break;
  }
  switch (header.asn_tag) {
  case AsnTag::kBoolean:
    return "BOOLEAN";
  case AsnTag::kInteger:
    return "INTEGER";
  case AsnTag::kBitString:
    return "BIT STRING";
  case AsnTag::kOctetString:
    return "OCTET STRING";
  case AsnTag::kNull:
    return "NULL";
  case AsnTag::kOid:
    return "OBJECT IDENTIFIER";
  case AsnTag::kEnumerated:
    return "ENUMERATED";
  case AsnTag::kUtf8String:
    return "UTF8 STRING";
  case AsnTag::kSequence:
    return "SEQUENCE";
  case AsnTag::kSet:
    return "SET";
  case AsnTag::kNumericString:
    return "NUMERIC STRING";
  case AsnTag::kPrintableString:
    return "PRINTABLE STRING";
  case AsnTag::kT61String:
    return "T61 STRING";
  case AsnTag::kIA5String:
    return "IA5 STRING";
  case AsnTag::kUTCTime:
    return "UTC TIME";
  case AsnTag::kGeneralizedTime:
    return "GENERALIZED TIME";
  case AsnTag::kVisibleString:
    return "VISIBLE STRING";
  case AsnTag::kBmpString:
    return "BMP STRING";
  case AsnTag::kUnknown:
    break;
  }
  return (header.constructed ? "CONSTRUCTED [" : "PRIMITIVE [") + number + "]";
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string FormatPrimitiveContent(AsnTag tag, BytesView content) {
  switch (tag) {
  case AsnTag::kBoolean:
    if (content.size() == 1) {
      return content[0] == 0x00 ? "FALSE" : "TRUE";
    }
    return VecBytesStringRepresentation(content);

  case AsnTag::kInteger:
    if (!content.empty() && content.size() <= kMaxNumericBytes) {
      return std::to_string(SignedValue(content)) + " (0x" +
             VecBytesStringRepresentation(content, true) + ")";
    }
    return VecBytesStringRepresentation(content);

  case AsnTag::kEnumerated:
    if (!content.empty() && content.size() <= kMaxNumericBytes) {
      return "ENUM(" + std::to_string(SignedValue(content)) + ")";
    }
    return VecBytesStringRepresentation(content);

  case AsnTag::kBitString: {
    if (content.empty()) {
      return {};
    }
    const BytesView bits(content.data() + 1, content.size() - 1);
    return "unused bits: " + std::to_string(content[0]) +
           ", data: " + HexPreview(bits, kMaxDisplayBytes);
  }

  case AsnTag::kNull:
    return {};

  case AsnTag::kOid: {
    std::string oid = DecodeOid(content);
    auto name = OidName(oid);
    if (name) {
      oid += " (";
      oid += name.value();
      oid += ")";
    }
    return oid;
  }

  case AsnTag::kUtf8String:
  case AsnTag::kNumericString:
  case AsnTag::kPrintableString:
  case AsnTag::kT61String:
  case AsnTag::kIA5String:
  case AsnTag::kVisibleString:
  case AsnTag::kUTCTime:
  case AsnTag::kGeneralizedTime:
    return QuoteString(content);

  default:
    return HexPreview(content, kMaxDisplayBytes);
  }
}

std::string FormatContent(const AsnElement &element) {
  if (element.IsConstructed() || element.raw_content.empty()) {
    return {};
  }
  if (element.header.tag_type != AsnTagType::kUniversal) {
    return HexPreview(element.raw_content, kMaxDisplayBytes);
  }
  return FormatPrimitiveContent(element.GetAsnTag(), element.raw_content);
}

std::string QuoteString(BytesView content) {
  std::stringstream builder;
  builder << '"';
  for (const auto symbol : content) {
    if (symbol == '"' || symbol == '\\') {
      builder << '\\' << static_cast<char>(symbol);
    } else if (symbol < 0x20 || symbol == 0x7F) {
      builder << "\\x" << std::hex << std::setw(2) << std::setfill('0')
              << static_cast<int>(symbol) << std::dec;
    } else {
      // UTF-8 sequences are passed as is
      builder << static_cast<char>(symbol);
    }
  }
  builder << '"';
  return builder.str();
}

} // namespace asnsig::asn
