/* File: key_size.hpp
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

namespace asnsig::asn {

/**
 * @brief Estimate the key size of a signature structure
 * @details A heuristic, not a cryptographic fact: certificate and signature
 * structures usually end with the key or signature material. If the last
 * element of a depth-first walk is an OCTET STRING, its length in bits is
 * returned.
 * @param data the structure bytes
 * @return uint64_t size in bits, 0 if undetermined
 */
[[nodiscard]] uint64_t EstimateKeySize(BytesView data);

} // namespace asnsig::asn
