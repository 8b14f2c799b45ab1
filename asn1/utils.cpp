/* File: utils.cpp
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

#include "utils.hpp"

#include <iomanip>
#include <sstream>
#include <string>

#include "typedefs.hpp"

namespace asnsig::asn {

std::string VecBytesStringRepresentation(BytesView data,
                                         bool uppercase) {
  std::stringstream builder;
  if (uppercase) {
    builder << std::uppercase;
  }
  for (const auto symbol : data) {
    builder << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(symbol);
  }
  return builder.str();
}

std::string HexPreview(BytesView data, uint64_t max_bytes) {
  if (data.size() <= max_bytes) {
    return VecBytesStringRepresentation(data);
  }
  std::string res = VecBytesStringRepresentation({data.data(), max_bytes});
  res += "... (";
  res += std::to_string(data.size());
  res += " bytes)";
  return res;
}

} // namespace asnsig::asn
