#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>

#include "typedefs.hpp"

namespace asnsig::asn::test {

// DER length octets for the content size
inline BytesVector Tlv(unsigned char tag, const BytesVector &content) {
  BytesVector res{tag};
  const size_t len = content.size();
  if (len < 128) {
    res.push_back(static_cast<unsigned char>(len));
  } else if (len < 256) {
    res.push_back(0x81);
    res.push_back(static_cast<unsigned char>(len));
  } else {
    res.push_back(0x82);
    res.push_back(static_cast<unsigned char>(len >> 8));
    res.push_back(static_cast<unsigned char>(len & 0xFF));
  }
  res.insert(res.end(), content.cbegin(), content.cend());
  return res;
}

inline BytesVector Concat(std::initializer_list<BytesVector> parts) {
  BytesVector res;
  for (const auto &part : parts) {
    res.insert(res.end(), part.cbegin(), part.cend());
  }
  return res;
}

inline BytesVector Str(const std::string &val) {
  return {val.cbegin(), val.cend()};
}

// OID content octets
const BytesVector kCommonName{0x55, 0x04, 0x03};
const BytesVector kCountryName{0x55, 0x04, 0x06};
const BytesVector kLocalityName{0x55, 0x04, 0x07};
const BytesVector kOrganizationName{0x55, 0x04, 0x0A};
const BytesVector kEmailAddress{0x2A, 0x86, 0x48, 0x86, 0xF7,
                                0x0D, 0x01, 0x09, 0x01};

/// SET { SEQUENCE { OID, PrintableString } }
inline BytesVector Rdn(const BytesVector &oid, const std::string &val,
                       unsigned char str_tag = 0x13) {
  return Tlv(0x31, Tlv(0x30, Concat({Tlv(0x06, oid), Tlv(str_tag, Str(val))})));
}

inline BytesVector SignerName() {
  return Tlv(0x30, Concat({Rdn(kCountryName, "US"),
                           Rdn(kLocalityName, "Redmond"),
                           Rdn(kOrganizationName, "Example Corp"),
                           Rdn(kCommonName, "Example Signer"),
                           Rdn(kEmailAddress, "signer@example.com", 0x16)}));
}

/// SEQUENCE { SEQUENCE { INTEGER 1 }, Name, OCTET STRING (256 bytes) }
inline BytesVector SignatureBlob() {
  return Tlv(0x30, Concat({Tlv(0x30, Tlv(0x02, {0x01})), SignerName(),
                           Tlv(0x04, BytesVector(256, 0x00))}));
}

/// n nested SEQUENCEs around INTEGER 1
inline BytesVector Nested(size_t levels) {
  BytesVector res = Tlv(0x02, {0x01});
  for (size_t i = 0; i < levels; ++i) {
    res = Tlv(0x30, res);
  }
  return res;
}

} // namespace asnsig::asn::test
