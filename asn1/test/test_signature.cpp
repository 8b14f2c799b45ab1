/* File: test_signature.cpp
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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <new>
#include <thread>
#include <utility>
#include <vector>
#include <catch2/catch.hpp>

#include "asn1.hpp"
#include "asn_error.hpp"
#include "content_formatter.hpp"
#include "field_extractor.hpp"
#include "key_size.hpp"
#include "signature_locator.hpp"
#include "test_helpers.hpp"
#include "tree_walker.hpp"
#include "typedefs.hpp"

using namespace asnsig::asn;
using namespace asnsig::asn::test;

namespace {

BytesVector Prefix(size_t size) {
  BytesVector res(size);
  for (size_t i = 0; i < size; ++i) {
    // no 0x30 bytes
    res[i] = static_cast<unsigned char>((i % 0x2F) + 1);
  }
  return res;
}

// a signature with an other common name and no key material
BytesVector OtherSignatureBlob() {
  const BytesVector name =
    Tlv(0x30, Concat({Rdn(kCountryName, "DE"), Rdn(kLocalityName, "Berlin"),
                      Rdn(kOrganizationName, "Other Corp"),
                      Rdn(kCommonName, "Other Signer"),
                      Rdn(kEmailAddress, "other@example.com", 0x16)}));
  return Tlv(0x30, Concat({name, Tlv(0x04, BytesVector(200, 0x11))}));
}

} // namespace

TEST_CASE("Field extraction") {
  SECTION("Signer name") {
    const BytesVector data = SignerName();
    auto res = ExtractFields(BytesView(data));
    REQUIRE(res.IsValid());
    REQUIRE(res.countryName == "US");
    REQUIRE(res.localityName == "Redmond");
    REQUIRE(res.organizationName == "Example Corp");
    REQUIRE(res.commonName == "Example Signer");
    REQUIRE(res.emailAddress == "signer@example.com");
    REQUIRE(res.DistinguishedName() ==
            "C=US, L=Redmond, O=Example Corp, CN=Example Signer, "
            "E=signer@example.com");
  }

  SECTION("Any order") {
    const BytesVector data = Tlv(
      0x30, Concat({Rdn(kEmailAddress, "e@x.org", 0x16),
                    Rdn(kCommonName, "CN", 0x0C), Rdn(kOrganizationName, "O"),
                    Rdn(kLocalityName, "L"), Rdn(kCountryName, "RU")}));
    auto res = ExtractFields(BytesView(data));
    REQUIRE(res.IsValid());
    REQUIRE(res.commonName == "CN");
    REQUIRE(res.emailAddress == "e@x.org");
  }

  SECTION("Missing attribute") {
    const BytesVector data =
      Tlv(0x30, Concat({Rdn(kCountryName, "US"), Rdn(kLocalityName, "Redmond"),
                        Rdn(kOrganizationName, "Example Corp"),
                        Rdn(kCommonName, "Example Signer")}));
    auto res = ExtractFields(BytesView(data));
    REQUIRE_FALSE(res.IsValid());
    REQUIRE_FALSE(res.emailAddress.has_value());
    REQUIRE(res.commonName == "Example Signer");
    REQUIRE(res.DistinguishedName() ==
            "C=US, L=Redmond, O=Example Corp, CN=Example Signer");
  }

  SECTION("Last occurrence wins") {
    const BytesVector data = Tlv(
      0x30, Concat({Rdn(kCommonName, "Issuer"), Rdn(kCommonName, "Subject")}));
    auto res = ExtractFields(BytesView(data));
    REQUIRE(res.commonName == "Subject");
  }

  SECTION("Empty or constructed value is ignored") {
    const BytesVector empty_value = Rdn(kCommonName, "");
    auto res = ExtractFields(BytesView(empty_value));
    REQUIRE_FALSE(res.commonName.has_value());

    const BytesVector cons_value = Tlv(
      0x30, Concat({Tlv(0x06, kCommonName), Tlv(0x30, Tlv(0x13, Str("x")))}));
    res = ExtractFields(BytesView(cons_value));
    REQUIRE_FALSE(res.commonName.has_value());
  }

  SECTION("OID as the last element") {
    const BytesVector data = Tlv(0x30, Tlv(0x06, kCommonName));
    auto res = ExtractFields(BytesView(data));
    REQUIRE_FALSE(res.commonName.has_value());
  }

  SECTION("Value in a broken region") {
    // SET { SEQUENCE { OID commonName, PrintableString truncated } }
    BytesVector data = Rdn(kCommonName, "abc");
    data[data.size() - 4] = 0x05; // PrintableString length 5 instead of 3
    auto res = ExtractFields(BytesView(data));
    REQUIRE_FALSE(res.commonName.has_value());
  }

  SECTION("Empty input") {
    auto res = ExtractFields(BytesView());
    REQUIRE_FALSE(res.IsValid());
    REQUIRE(res.DistinguishedName().empty());
  }
}

// ---------------------------------------------------------------

TEST_CASE("Key size") {
  const BytesVector blob = SignatureBlob();
  REQUIRE(EstimateKeySize(BytesView(blob)) == 2048);
  REQUIRE(EstimateKeySize(BytesView()) == 0);

  const BytesVector plain = Tlv(0x30, Tlv(0x04, BytesVector(256, 0x5A)));
  REQUIRE(EstimateKeySize(BytesView(plain)) == 2048);

  // last element is an INTEGER
  const BytesVector nested = Nested(3);
  REQUIRE(EstimateKeySize(BytesView(nested)) == 0);

  // the last element is nested deeper than its siblings
  const BytesVector deep_octets =
    Tlv(0x30, Concat({Tlv(0x02, {0x01}),
                      Tlv(0x30, Tlv(0x04, BytesVector(128, 0x01)))}));
  REQUIRE(EstimateKeySize(BytesView(deep_octets)) == 1024);

  // OCTET STRING that is not the last element
  const BytesVector octets_first = Tlv(
    0x30, Concat({Tlv(0x04, BytesVector(128, 0x01)), Tlv(0x05, {})}));
  REQUIRE(EstimateKeySize(BytesView(octets_first)) == 0);

  // context specific [4] is not an OCTET STRING
  const BytesVector ctx = Tlv(0x30, Tlv(0x84, BytesVector(16, 0x01)));
  REQUIRE(EstimateKeySize(BytesView(ctx)) == 0);

  // the walk stops at a broken element, the last decoded one counts
  const BytesVector partial =
    Concat({Tlv(0x04, BytesVector(4, 0x01)), {0x02, 0x05, 0x01}});
  REQUIRE(EstimateKeySize(BytesView(partial)) == 32);
}

// ---------------------------------------------------------------

TEST_CASE("Signature locator") {
  const BytesVector blob = SignatureBlob();
  REQUIRE(blob[0] == 0x30);
  REQUIRE(blob[1] == 0x82);

  SECTION("Signature appended to a file") {
    const BytesVector buffer = Concat({Prefix(1000), blob});
    auto match = LocateSignature(BytesView(buffer));
    REQUIRE(match.Offset() == 1000);
    REQUIRE(match.FullBytes().size() == blob.size());
    REQUIRE(match.FullBytes().ToVector() == blob);
    REQUIRE(match.FullBytes().data() == buffer.data() + 1000);
    REQUIRE(match.Validation().IsValid());
    REQUIRE(match.Validation().commonName == "Example Signer");
  }

  SECTION("Signature at the start of the buffer") {
    auto match = LocateSignature(BytesView(blob));
    REQUIRE(match.Offset() == 0);
    REQUIRE(match.FullBytes().size() == blob.size());
  }

  SECTION("Trailing bytes after the signature") {
    const BytesVector buffer =
      Concat({Prefix(10), blob, {0x30, 0x82, 0xFF, 0xFF, 0x00}, Prefix(7)});
    auto match = LocateSignature(BytesView(buffer));
    REQUIRE(match.Offset() == 10);
  }

  SECTION("Rightmost valid candidate wins") {
    const BytesVector other = OtherSignatureBlob();
    REQUIRE(other[1] == 0x82);
    const BytesVector buffer = Concat({Prefix(5), blob, Prefix(3), other});
    SignatureLocator locator{BytesView(buffer)};
    auto match = locator.Locate();
    REQUIRE(match.Offset() == 5 + blob.size() + 3);
    REQUIRE(match.Validation().commonName == "Other Signer");
    // deterministic
    auto again = locator.Find();
    REQUIRE(again.has_value());
    REQUIRE(again->Offset() == match.Offset());
  }

  SECTION("Decodable structure without attributes") {
    const BytesVector buffer =
      Concat({Prefix(64), {0x30, 0x82, 0x00, 0x08, 0x30, 0x03, 0x02, 0x01,
                           0x01, 0x04, 0x01, 0x00}});
    SignatureLocator locator{BytesView(buffer)};
    REQUIRE_FALSE(locator.Find().has_value());
    REQUIRE_THROWS_AS(locator.Locate(), AsnError);
    try {
      [[maybe_unused]] auto match = locator.Locate();
    } catch (const AsnError &ex) {
      REQUIRE(ex.Code() == ErrorCode::kNoSignatureFound);
    }
  }

  SECTION("Tiny buffers") {
    REQUIRE_FALSE(SignatureLocator(BytesView()).Find().has_value());
    const BytesVector one{0x30};
    REQUIRE_FALSE(SignatureLocator(BytesView(one)).Find().has_value());
    const BytesVector marker{0x30, 0x82};
    REQUIRE_FALSE(SignatureLocator(BytesView(marker)).Find().has_value());
    const BytesVector marker_at_end = Concat({Prefix(20), {0x30, 0x82}});
    REQUIRE_THROWS_AS(LocateSignature(BytesView(marker_at_end)), AsnError);
  }
}

// ---------------------------------------------------------------

TEST_CASE("Hostile input") {
  const BytesVector blob = SignatureBlob();

  SECTION("Truncated signature") {
    for (size_t size = 0; size < blob.size(); ++size) {
      const BytesView view(blob.data(), size);
      REQUIRE_FALSE(SignatureLocator(view).Find().has_value());
      REQUIRE_NOTHROW(ExtractFields(view));
      REQUIRE_NOTHROW(EstimateKeySize(view));
    }
  }

  SECTION("Random bytes") {
    std::mt19937 gen(20240716);
    std::uniform_int_distribution<int> dist(0, 255);
    for (int round = 0; round < 200; ++round) {
      BytesVector data(512);
      for (auto &oct : data) {
        oct = static_cast<unsigned char>(dist(gen));
      }
      // plant some markers to exercise the candidate path
      data[100] = 0x30;
      data[101] = 0x82;
      data[400] = 0x30;
      data[401] = 0x82;
      REQUIRE_NOTHROW(SignatureLocator(BytesView(data)).Find());
      REQUIRE_NOTHROW(ExtractFields(BytesView(data)));
      REQUIRE_NOTHROW(EstimateKeySize(BytesView(data)));
    }
  }

  SECTION("Deep nesting") {
    const BytesVector nested = Nested(1000);
    struct NullVisitor : IElementVisitor {
      void OnElement(const AsnElement & /*element*/) override {}
    } visitor;
    auto status = WalkTree(BytesView(nested), 0, visitor);
    REQUIRE(status.issues.size() == 1);
    REQUIRE(status.issues[0].code == ErrorCode::kRecursionLimitExceeded);
    REQUIRE(status.elements_visited == kMaxRecursionDepth + 1);
    REQUIRE(EstimateKeySize(BytesView(nested)) == 0);
    REQUIRE_FALSE(ExtractFields(BytesView(nested)).IsValid());
    REQUIRE_FALSE(SignatureLocator(BytesView(nested)).Find().has_value());
  }

  SECTION("Concurrent lookups") {
    const BytesVector buffer = Concat({Prefix(4096), blob, Prefix(512)});
    constexpr size_t kThreads = 4;
    std::vector<std::vector<uint64_t>> offsets(kThreads);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < kThreads; ++i) {
      threads.emplace_back([&buffer, &offsets, i]() {
        for (int round = 0; round < 20; ++round) {
          auto match = SignatureLocator(BytesView(buffer)).Find();
          offsets[i].push_back(match ? match->Offset() : 0);
        }
      });
    }
    for (auto &thr : threads) {
      thr.join();
    }
    for (const auto &thread_offsets : offsets) {
      REQUIRE(thread_offsets.size() == 20);
      for (const auto offset : thread_offsets) {
        REQUIRE(offset == 4096);
      }
    }
  }
}

// ---------------------------------------------------------------

TEST_CASE("Allocation failures propagate") {
  STATIC_REQUIRE(!noexcept(std::declval<const SignatureLocator &>().Find()));
  STATIC_REQUIRE(!noexcept(ExtractFields(std::declval<BytesView>())));
  STATIC_REQUIRE(
    !noexcept(FormatPrimitiveContent(AsnTag::kOid, std::declval<BytesView>())));
  STATIC_REQUIRE(!noexcept(QuoteString(std::declval<BytesView>())));
  STATIC_REQUIRE(
    !noexcept(std::declval<const ValidationResult &>().DistinguishedName()));
  STATIC_REQUIRE(!noexcept(DecodeOidEx(std::declval<BytesView>())));

  // only decoding errors are handled inside the walk
  struct FailingVisitor : IElementVisitor {
    void OnElement(const AsnElement & /*element*/) override {
      throw std::bad_alloc();
    }
  } visitor;
  const BytesVector blob = SignatureBlob();
  REQUIRE_THROWS_AS(WalkTree(BytesView(blob), 0, visitor), std::bad_alloc);
}
