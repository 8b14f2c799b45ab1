/* File: oids.hpp
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

namespace asnsig::asn {

// rfc3280#appendix-A

// id-at OBJECT IDENTIFIER ::= { joint-iso-ccitt(2) ds(5) 4 }

// id-at-commonName        AttributeType ::= { id-at 3 }
constexpr const char *const kOid_id_at_commonName = "2.5.4.3";

// id-at-surname           AttributeType ::= { id-at 4 }
constexpr const char *const kOid_id_at_surname = "2.5.4.4";

// id-at-serialNumber      AttributeType ::= { id-at 5 }
constexpr const char *const kOid_id_at_serialNumber = "2.5.4.5";

// id-at-countryName       AttributeType ::= { id-at 6 }
constexpr const char *const kOid_id_at_countryName = "2.5.4.6";

// id-at-localityName      AttributeType ::= { id-at 7 }
constexpr const char *const kOid_id_at_localityName = "2.5.4.7";

// id-at-stateOrProvinceName AttributeType ::= { id-at 8 }
constexpr const char *const kOid_id_at_stateOrProvinceName = "2.5.4.8";

// id-at-organizationName  AttributeType ::= { id-at 10 }
constexpr const char *const kOid_id_at_organizationName = "2.5.4.10";

// id-at-organizationalUnitName AttributeType ::= { id-at 11 }
constexpr const char *const kOid_id_at_organizationalUnitName = "2.5.4.11";

// pkcs-9 OBJECT IDENTIFIER ::=
//       { iso(1) member-body(2) us(840) rsadsi(113549) pkcs(1) 9 }

// id-emailAddress          AttributeType ::= { pkcs-9 1 }
constexpr const char *const kOid_id_emailAddress = "1.2.840.113549.1.9.1";

// id-contentType OBJECT IDENTIFIER ::= { pkcs-9 3 }
constexpr const char *const kOid_id_contentType = "1.2.840.113549.1.9.3";

// id-messageDigest OBJECT IDENTIFIER ::= { pkcs-9 4 }
constexpr const char *const kOid_id_messageDigest = "1.2.840.113549.1.9.4";

// id-signingTime OBJECT IDENTIFIER ::= { pkcs-9 5 }
constexpr const char *const kOid_id_signingTime = "1.2.840.113549.1.9.5";

// RFC 5652
constexpr const char *const kOID_Data = "1.2.840.113549.1.7.1";
constexpr const char *const kOID_SignedData = "1.2.840.113549.1.7.2";

// Microsoft Authenticode SpcIndirectDataContent
constexpr const char *const kOID_SpcIndirectDataContent =
    "1.3.6.1.4.1.311.2.1.4";

// RFC 8017 PKCS #1
constexpr const char *const kOid_rsaEncryption = "1.2.840.113549.1.1.1";
constexpr const char *const kOid_sha1WithRSAEncryption =
    "1.2.840.113549.1.1.5";
constexpr const char *const kOid_sha256WithRSAEncryption =
    "1.2.840.113549.1.1.11";
constexpr const char *const kOid_sha384WithRSAEncryption =
    "1.2.840.113549.1.1.12";
constexpr const char *const kOid_sha512WithRSAEncryption =
    "1.2.840.113549.1.1.13";

// RFC 5480, RFC 5758
constexpr const char *const kOid_ecPublicKey = "1.2.840.10045.2.1";
constexpr const char *const kOid_ecdsa_with_SHA256 = "1.2.840.10045.4.3.2";

// NIST hash algorithms
constexpr const char *const kOid_sha256 = "2.16.840.1.101.3.4.2.1";
constexpr const char *const kOid_sha384 = "2.16.840.1.101.3.4.2.2";
constexpr const char *const kOid_sha512 = "2.16.840.1.101.3.4.2.3";

// OIW
constexpr const char *const kOid_sha1 = "1.3.14.3.2.26";

// RFC5280 4.2.1
// id-ce   OBJECT IDENTIFIER ::=  { joint-iso-ccitt(2) ds(5) 29 }
constexpr const char *const kOID_id_ce_keyUsage = "2.5.29.15";
constexpr const char *const kOID_id_ce_basicConstraints = "2.5.29.19";
constexpr const char *const kOID_id_ce_extKeyUsage = "2.5.29.37";

} // namespace asnsig::asn
