/* File: utils.hpp
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
#include <cstdint>
#include <string>

namespace asnsig::asn {

/**
 * @brief Hex representation of bytes (two symbols per byte)
 * @param data bytes to print
 * @param uppercase use A-F instead of a-f
 */
[[nodiscard]] std::string
VecBytesStringRepresentation(BytesView data, bool uppercase = false);

/**
 * @brief Hex representation of at most max_bytes first bytes
 * @details A longer data is cut and marked with "... (N bytes)"
 */
[[nodiscard]] std::string HexPreview(BytesView data,
                                     uint64_t max_bytes);

} // namespace asnsig::asn
