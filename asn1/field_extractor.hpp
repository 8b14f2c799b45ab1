/* File: field_extractor.hpp
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

#include "typedefs.hpp"
#include <optional>
#include <string>

namespace asnsig::asn {

using OptString = std::optional<std::string>;

/**
 * @brief Signer's distinguished name attributes found in a structure
 * @details An attribute is present if its OID was followed by a non-empty
 * primitive value.
 */
struct ValidationResult {
  OptString commonName;
  OptString countryName;
  OptString localityName;
  OptString organizationName;
  OptString emailAddress;

  /// @brief all five attributes are present
  [[nodiscard]] bool IsValid() const noexcept;

  /// @brief C=.., L=.., O=.., CN=.., E=..
  [[nodiscard]] std::string DistinguishedName() const;
};

/**
 * @brief Look for the signer's attributes in a decoded structure
 * @details Every OBJECT IDENTIFIER naming one of the attributes is paired with
 * the sibling element that immediately follows it. If an attribute occurs
 * several times, the last occurrence in document order wins. Malformed parts
 * of the structure are skipped, the function never fails.
 * @param data the structure bytes
 * @return ValidationResult
 */
[[nodiscard]] ValidationResult ExtractFields(BytesView data);

} // namespace asnsig::asn
