#include "oid_table.hpp"
#include "oids.hpp"
#include <map>
#include <optional>
#include <string>

namespace asnsig::asn {

const OidNamesMap &KnownOids() {
  // clang-format off
  static const OidNamesMap kNames{
    {kOid_rsaEncryption, "rsaEncryption"},
    {kOid_sha1WithRSAEncryption, "sha1WithRSAEncryption"},
    {kOid_sha256WithRSAEncryption, "sha256WithRSAEncryption"},
    {kOid_sha384WithRSAEncryption, "sha384WithRSAEncryption"},
    {kOid_sha512WithRSAEncryption, "sha512WithRSAEncryption"},
    {kOid_ecPublicKey, "ecPublicKey"},
    {kOid_ecdsa_with_SHA256, "ecdsa-with-SHA256"},
    {kOid_sha256, "sha256"},
    {kOid_sha384, "sha384"},
    {kOid_sha512, "sha512"},
    {kOid_sha1, "sha1"},
    {kOid_id_at_commonName, "commonName"},
    {kOid_id_at_surname, "surname"},
    {kOid_id_at_serialNumber, "serialNumber"},
    {kOid_id_at_countryName, "countryName"},
    {kOid_id_at_localityName, "localityName"},
    {kOid_id_at_stateOrProvinceName, "stateOrProvinceName"},
    {kOid_id_at_organizationName, "organizationName"},
    {kOid_id_at_organizationalUnitName, "organizationalUnitName"},
    {kOid_id_emailAddress, "emailAddress"},
    {kOid_id_contentType, "contentType"},
    {kOid_id_messageDigest, "messageDigest"},
    {kOid_id_signingTime, "signingTime"},
    {kOID_Data, "data"},
    {kOID_SignedData, "signedData"},
    {kOID_SpcIndirectDataContent, "spcIndirectDataContext"},
    {kOID_id_ce_keyUsage, "keyUsage"},
    {kOID_id_ce_basicConstraints, "basicConstraints"},
    {kOID_id_ce_extKeyUsage, "extKeyUsage"},
  };
  // clang-format on
  return kNames;
}

std::optional<std::string> OidName(const std::string &oid) {
  const auto &names = KnownOids();
  auto it_name = names.find(oid);
  if (it_name == names.cend()) {
    return std::nullopt;
  }
  return it_name->second;
}

} // namespace asnsig::asn
