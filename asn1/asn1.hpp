#pragma once

#include "asn_error.hpp"
#include "typedefs.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace asnsig::asn {

enum class AsnTag : uint8_t {
  kBoolean,
  kInteger,
  kBitString,
  kOctetString,
  kNull,
  kOid,
  kEnumerated,
  kUtf8String,
  kSequence,
  kSet,
  kNumericString,
  kPrintableString,
  kT61String,
  kIA5String,
  kUTCTime,
  kGeneralizedTime,
  kVisibleString,
  kBmpString,
  kUnknown
};
enum class AsnTagType : uint8_t {
  kUniversal,
  kApplication,
  kContentSpecific,
  kPrivate
};

/// @brief the tag number that marks a long form (multi-octet) tag
constexpr uint8_t kLongFormTagMarker = 0x1F;

// ----------------------------------------
/**
 * @brief ASN1 header (tag and length octets)
 * @details The whole element (header + content) is guaranteed to fit into the
 * data passed to the constructor.
 * @throws AsnError on fail
 */
struct AsnHeader {
  AsnTagType tag_type = AsnTagType::kUniversal;
  AsnTag asn_tag = AsnTag::kUnknown;
  bool constructed = false;
  uint8_t tag_number = 0;
  uint64_t content_length = 0;
  uint64_t sizeof_header = 0;

  AsnHeader() = default;
  explicit AsnHeader(const unsigned char *ptr_data, uint64_t data_size);

  [[nodiscard]] uint64_t FullSize() const noexcept {
    return sizeof_header + content_length;
  }
  [[nodiscard]] std::string ConstructedStr() const noexcept;
};

// ----------------------------------------
/**
 * @brief One decoded TLV unit
 * @details raw_content points into the decoded buffer, nothing is copied.
 */
struct AsnElement {
  AsnHeader header;
  /// nesting level, 0 for the top-level elements of a region
  size_t depth = 0;
  /// absolute position of the tag octet
  uint64_t offset = 0;
  BytesView raw_content;

  [[nodiscard]] AsnTag GetAsnTag() const noexcept { return header.asn_tag; }
  [[nodiscard]] bool IsConstructed() const noexcept {
    return header.constructed;
  }
  [[nodiscard]] uint64_t HeaderLength() const noexcept {
    return header.sizeof_header;
  }
  [[nodiscard]] uint64_t ContentLength() const noexcept {
    return header.content_length;
  }
  [[nodiscard]] uint64_t FullSize() const noexcept {
    return header.FullSize();
  }
  /// @brief true for the universal class element with the given tag
  [[nodiscard]] bool Is(AsnTag tag) const noexcept {
    return header.tag_type == AsnTagType::kUniversal && header.asn_tag == tag;
  }
};

struct DecodedElement {
  AsnElement element;
  uint64_t bytes_consumed = 0;
};

/**
 * @brief Decode exactly one TLV header from the window
 * @param window bytes starting with the tag octet
 * @param depth nesting level to record
 * @param offset absolute position of window[0] in the original buffer
 * @return DecodedElement element and header+content size
 * @throws AsnError
 */
[[nodiscard]] DecodedElement DecodeElement(BytesView window, size_t depth,
                                           uint64_t offset);

// ----------------------------------------

struct OidDecodeResult {
  std::string dotted;
  /// kMalformedOid if the content ended in the middle of an arc
  std::optional<ErrorCode> error;
};

/**
 * @brief Decode the OBJECT IDENTIFIER content octets to dotted-decimal form
 * @details Never reads past the content. A broken last arc is dropped, the
 * arcs decoded before it are returned.
 */
[[nodiscard]] OidDecodeResult DecodeOidEx(BytesView content);

/// @brief same as DecodeOidEx, best-effort string only
[[nodiscard]] std::string DecodeOid(BytesView content);

} // namespace asnsig::asn
