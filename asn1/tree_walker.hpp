/* File: tree_walker.hpp
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
#include "asn_error.hpp"
#include "typedefs.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace asnsig::asn {

constexpr size_t kMaxRecursionDepth = 50;
constexpr size_t kMaxElementsPerLevel = 10000;

struct WalkLimits {
  /// a constructed element at this depth or deeper is not descended into
  size_t max_depth = kMaxRecursionDepth;
  /// maximal number of sibling elements in one region
  size_t max_elements_per_level = kMaxElementsPerLevel;
};

/// @brief a region (or sub-tree) that was abandoned
struct WalkIssue {
  ErrorCode code;
  /// absolute offset where decoding stopped
  uint64_t offset = 0;
  size_t depth = 0;
};

struct WalkStatus {
  std::vector<WalkIssue> issues;
  uint64_t elements_visited = 0;

  [[nodiscard]] bool Ok() const noexcept { return issues.empty(); }
};

/**
 * @brief Visitor for WalkTree
 */
class IElementVisitor {
public:
  IElementVisitor() = default;
  IElementVisitor(const IElementVisitor &) = default;
  IElementVisitor(IElementVisitor &&) = default;
  IElementVisitor &operator=(const IElementVisitor &) = default;
  IElementVisitor &operator=(IElementVisitor &&) = default;

  virtual ~IElementVisitor() = default;

  /// @brief called for every decoded element in document order
  virtual void OnElement(const AsnElement &element) = 0;

  /**
   * @brief called when a region stops decoding
   * @param issue what happened
   * @param region the whole region that was being decoded
   * @param region_depth depth of the region's elements
   */
  virtual void OnRegionError(const WalkIssue & /*issue*/, BytesView /*region*/,
                             size_t /*region_depth*/) {}
};

/**
 * @brief Depth-first, document-order decode of a region
 * @details A decode failure stops the current region only, the parent region
 * goes on with the next sibling. Never throws on malformed data, exceptions
 * thrown by the visitor are passed through.
 * @param region bytes to decode
 * @param base_offset absolute offset of region[0]
 * @param visitor
 * @param limits
 * @return WalkStatus issues found
 */
WalkStatus WalkTree(BytesView region, uint64_t base_offset,
                    IElementVisitor &visitor, const WalkLimits &limits = {});

} // namespace asnsig::asn
