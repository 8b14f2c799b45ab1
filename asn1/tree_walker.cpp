/* File: tree_walker.cpp
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

#include "tree_walker.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

#include "asn1.hpp"
#include "asn_error.hpp"
#include "logger_utils.hpp"

namespace asnsig::asn {

namespace {

class Walker {
 public:
  Walker(IElementVisitor &visitor, const WalkLimits &limits)
    : visitor_(visitor), limits_(limits) {}

  void WalkRegion(BytesView region, uint64_t base_offset, size_t depth);

  WalkStatus &Status() noexcept { return status_; }

 private:
  void Report(ErrorCode code, uint64_t offset, size_t depth, BytesView region);

  IElementVisitor &visitor_;
  const WalkLimits &limits_;
  WalkStatus status_;
};

void Walker::WalkRegion(BytesView region, uint64_t base_offset,
                        size_t depth) {
  uint64_t pos = 0;
  size_t it_number = 0;
  while (pos < region.size()) {
    ++it_number;
    if (it_number > limits_.max_elements_per_level) {
      Report(ErrorCode::kTooManyElements, base_offset + pos, depth, region);
      return;
    }
    DecodedElement decoded;
    try {
      decoded = DecodeElement(region.Tail(pos), depth, base_offset + pos);
    } catch (const AsnError &ex) {
      Report(ex.Code(), base_offset + pos, depth, region);
      return;
    }
    const AsnElement &element = decoded.element;
    ++status_.elements_visited;
    visitor_.OnElement(element);
    if (element.IsConstructed()) {
      if (depth >= limits_.max_depth) {
        Report(ErrorCode::kRecursionLimitExceeded, element.offset, depth + 1,
               element.raw_content);
      } else if (!element.raw_content.empty()) {
        // raw_content was validated against this region by DecodeElement
        WalkRegion(element.raw_content,
                   element.offset + element.HeaderLength(), depth + 1);
      }
    }
    pos += decoded.bytes_consumed;
  }
}

void Walker::Report(ErrorCode code, uint64_t offset, size_t depth,
                    BytesView region) {
  const WalkIssue issue{code, offset, depth};
  status_.issues.push_back(issue);
  auto logger = logger::InitLog();
  if (logger) {
    logger->trace("[WalkTree] region abandoned at offset {} depth {}: {}",
                  offset, depth, ErrorCodeStr(code));
  }
  visitor_.OnRegionError(issue, region, depth);
}

} // namespace

WalkStatus WalkTree(BytesView region, uint64_t base_offset,
                    IElementVisitor &visitor, const WalkLimits &limits) {
  Walker walker(visitor, limits);
  walker.WalkRegion(region, base_offset, 0);
  return std::move(walker.Status());
}

} // namespace asnsig::asn
