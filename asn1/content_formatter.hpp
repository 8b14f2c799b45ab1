/* File: content_formatter.hpp
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

#include "asn1.hpp"
#include "typedefs.hpp"
#include <cstdint>
#include <string>

namespace asnsig::asn {

/// @brief longer binary values are cut when displayed
constexpr uint64_t kMaxDisplayBytes = 32;

/**
 * @brief Human readable tag name
 * @return "SEQUENCE", "INTEGER", "CONTEXT SPECIFIC [0]" ...
 */
[[nodiscard]] std::string TagName(const AsnHeader &header);

/**
 * @brief Render the content of a universal primitive
 * @param tag universal tag
 * @param content raw content bytes
 * @return std::string semantic representation, hex for unknown types
 */
[[nodiscard]] std::string FormatPrimitiveContent(AsnTag tag,
                                                 BytesView content);

/**
 * @brief Render the element content for display
 * @details Empty for constructed and empty elements, hex for non-universal
 * classes.
 */
[[nodiscard]] std::string FormatContent(const AsnElement &element);

/// @brief double-quoted string with escaped quotes and control symbols
[[nodiscard]] std::string QuoteString(BytesView content);

} // namespace asnsig::asn
