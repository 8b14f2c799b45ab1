/* File: tree_printer.hpp
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

#include <cstddef>
#include <cstdint>
#include <ostream>

#include "asn1.hpp"
#include "tree_walker.hpp"
#include "typedefs.hpp"

namespace asnsig::cli {

/**
 * @brief Prints the decoded elements one per line
 * @details "<offset>:d=<depth> hl=<header> l=<length> <prim|cons>: <TAG>"
 * and the formatted content, a region that fails to decode is printed as a
 * hex dump.
 */
class TreePrinter : public asn::IElementVisitor {
 public:
  explicit TreePrinter(std::ostream& out) : out_(out) {}

  void OnElement(const asn::AsnElement& element) override;
  void OnRegionError(const asn::WalkIssue& issue, asn::BytesView region,
                     size_t region_depth) override;

 private:
  std::ostream& out_;
};

/**
 * @brief Print the whole structure
 * @param out stream
 * @param data structure bytes
 * @param base_offset absolute position of data[0] in the file
 * @return asn::WalkStatus
 */
asn::WalkStatus PrintTree(std::ostream& out, asn::BytesView data,
                          uint64_t base_offset);

}  // namespace asnsig::cli
