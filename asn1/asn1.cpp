#include "asn1.hpp"
#include "asn_error.hpp"
#include "typedefs.hpp"
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace asnsig::asn {

// ----------------------------------------
// AsnHeader

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
AsnHeader::AsnHeader(const unsigned char *ptr_data, uint64_t data_size) {
  if (ptr_data == nullptr || data_size < 2) {
    throw AsnError(ErrorCode::kTruncatedHeader,
                   "[AsnHeader] at least 2 bytes are expected");
  }
  std::bitset<8> byte0 = ptr_data[0];
  const bool bit8 = byte0.test(7);
  const bool bit7 = byte0.test(6);
  const bool bit6 = byte0.test(5);
  if (!bit8 && !bit7) {
    tag_type = AsnTagType::kUniversal;
  } else if (!bit8 && bit7) {
    tag_type = AsnTagType::kApplication;
  } else if (bit8 && !bit7) {
    tag_type = AsnTagType::kContentSpecific;
  } else {
    tag_type = AsnTagType::kPrivate;
  }
  constructed = bit6;
  byte0.set(7, false);
  byte0.set(6, false);
  byte0.set(5, false);
  tag_number = static_cast<uint8_t>(byte0.to_ulong());
  if (tag_number == kLongFormTagMarker) {
    throw AsnError(ErrorCode::kUnsupportedLongFormTag);
  }
  asn_tag = AsnTag::kUnknown;
  if (tag_type == AsnTagType::kUniversal) {
    switch (tag_number) {
    case 1:
      asn_tag = AsnTag::kBoolean;
      break;
    case 2:
      asn_tag = AsnTag::kInteger;
      break;
    case 3:
      asn_tag = AsnTag::kBitString;
      break;
    case 4:
      asn_tag = AsnTag::kOctetString;
      break;
    case 5:
      asn_tag = AsnTag::kNull;
      break;
    case 6:
      asn_tag = AsnTag::kOid;
      break;
    case 10:
      asn_tag = AsnTag::kEnumerated;
      break;
    case 12:
      asn_tag = AsnTag::kUtf8String;
      break;
    case 16:
      asn_tag = AsnTag::kSequence;
      break;
    case 17:
      asn_tag = AsnTag::kSet;
      break;
    case 18:
      asn_tag = AsnTag::kNumericString;
      break;
    case 19:
      asn_tag = AsnTag::kPrintableString;
      break;
    case 20:
      asn_tag = AsnTag::kT61String;
      break;
    case 22:
      asn_tag = AsnTag::kIA5String;
      break;
    case 23:
      asn_tag = AsnTag::kUTCTime;
      break;
    case 24:
      asn_tag = AsnTag::kGeneralizedTime;
      break;
    case 26:
      asn_tag = AsnTag::kVisibleString;
      break;
    case 30:
      asn_tag = AsnTag::kBmpString;
      break;
    default:
      break;
    }
  }
  // length
  sizeof_header = 2;
  const unsigned char byte1 = ptr_data[1];
  if (byte1 < 128) {
    content_length = byte1;
  } else {
    const unsigned char bytes_for_length = byte1 ^ 0b10000000;
    if (bytes_for_length == 0) {
      throw AsnError(ErrorCode::kIndefiniteLengthUnsupported);
    }
    if (bytes_for_length > data_size - 2) {
      throw AsnError(ErrorCode::kTruncatedLength);
    }
    content_length = 0;
    for (unsigned char i = 0; i < bytes_for_length; ++i) {
      if (content_length > (std::numeric_limits<uint64_t>::max() >> 8)) {
        throw AsnError(ErrorCode::kLengthOverflow);
      }
      content_length <<= 8;
      content_length |= ptr_data[2 + i];
    }
    sizeof_header += bytes_for_length;
  }
  if (content_length > data_size - sizeof_header) {
    throw AsnError(ErrorCode::kTruncatedContent);
  }
}

std::string AsnHeader::ConstructedStr() const noexcept {
  return constructed ? "cons" : "prim";
}

// ----------------------------------------

DecodedElement DecodeElement(BytesView window, size_t depth, uint64_t offset) {
  DecodedElement res;
  res.element.header = AsnHeader(window.data(), window.size());
  res.element.depth = depth;
  res.element.offset = offset;
  // the header constructor has already checked the bounds
  res.element.raw_content = window.SubView(res.element.HeaderLength(),
                                           res.element.ContentLength());
  res.bytes_consumed = res.element.FullSize();
  return res;
}

// ----------------------------------------
// OBJECT IDENTIFIER

namespace {

void AppendArc(std::string &res, uint64_t val) {
  if (!res.empty()) {
    res.push_back('.');
  }
  res.append(std::to_string(val));
}

} // namespace

OidDecodeResult DecodeOidEx(BytesView content) {
  OidDecodeResult res;
  if (content.empty()) {
    return res;
  }
  // the first octet holds the first two arcs
  AppendArc(res.dotted, content[0] / 40);
  AppendArc(res.dotted, content[0] % 40);
  uint64_t val = 0;
  bool arc_pending = false;
  for (const unsigned char oct : content.Tail(1)) {
    // the next shift would lose bits
    if (val > (std::numeric_limits<uint64_t>::max() >> 7)) {
      res.error = ErrorCode::kMalformedOid;
      return res;
    }
    val = (val << 7) | (oct & 0x7F);
    arc_pending = true;
    if ((oct & 0x80) != 0) {
      continue;
    }
    AppendArc(res.dotted, val);
    val = 0;
    arc_pending = false;
  }
  if (arc_pending) {
    res.error = ErrorCode::kMalformedOid;
  }
  return res;
}

std::string DecodeOid(BytesView content) {
  return DecodeOidEx(content).dotted;
}

} // namespace asnsig::asn
