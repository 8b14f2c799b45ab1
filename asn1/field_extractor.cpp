/* File: field_extractor.cpp
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

#include "field_extractor.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "asn1.hpp"
#include "logger_utils.hpp"
#include "oids.hpp"
#include "tree_walker.hpp"

namespace asnsig::asn {

namespace {

using Field = OptString ValidationResult::*;

std::optional<Field> FieldByOid(const std::string &oid) noexcept {
  if (oid == kOid_id_at_commonName) {
    return &ValidationResult::commonName;
  }
  if (oid == kOid_id_at_countryName) {
    return &ValidationResult::countryName;
  }
  if (oid == kOid_id_at_localityName) {
    return &ValidationResult::localityName;
  }
  if (oid == kOid_id_at_organizationName) {
    return &ValidationResult::organizationName;
  }
  if (oid == kOid_id_emailAddress) {
    return &ValidationResult::emailAddress;
  }
  return std::nullopt;
}

class FieldCollector : public IElementVisitor {
 public:
  explicit FieldCollector(ValidationResult &result) : result_(result) {}

  void OnElement(const AsnElement &element) override {
    // the element right after a matched OID, same parent
    if (pending_) {
      if (element.depth == pending_->depth &&
          element.offset == pending_->value_offset &&
          !element.IsConstructed() && !element.raw_content.empty()) {
        result_.*(pending_->field) = element.raw_content.ToString();
      }
      pending_.reset();
    }
    if (!element.Is(AsnTag::kOid) || element.IsConstructed() ||
        element.raw_content.empty()) {
      return;
    }
    auto field = FieldByOid(DecodeOid(element.raw_content));
    if (field) {
      pending_ = Pending{field.value(), element.depth,
                         element.offset + element.FullSize()};
    }
  }

 private:
  struct Pending {
    Field field;
    size_t depth;
    uint64_t value_offset;
  };

  ValidationResult &result_;
  std::optional<Pending> pending_;
};

} // namespace

bool ValidationResult::IsValid() const noexcept {
  return commonName && countryName && localityName && organizationName &&
         emailAddress;
}

// rfc1779 Table 1
std::string ValidationResult::DistinguishedName() const {
  std::string res;
  auto append = [&res](const char *key, const OptString &val) {
    if (!val) {
      return;
    }
    if (!res.empty()) {
      res += ", ";
    }
    res += key;
    res += val.value();
  };
  append("C=", countryName);
  append("L=", localityName);
  append("O=", organizationName);
  append("CN=", commonName);
  append("E=", emailAddress);
  return res;
}

ValidationResult ExtractFields(BytesView data) {
  ValidationResult res;
  FieldCollector collector(res);
  const WalkStatus status = WalkTree(data, 0, collector);
  if (!status.Ok()) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->trace("[ExtractFields] {} region(s) were not decoded",
                    status.issues.size());
    }
  }
  return res;
}

} // namespace asnsig::asn
