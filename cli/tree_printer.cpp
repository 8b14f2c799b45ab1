#include "tree_printer.hpp"

#include <iomanip>
#include <ostream>
#include <string>

#include "content_formatter.hpp"
#include "utils.hpp"

namespace asnsig::cli {

void TreePrinter::OnElement(const asn::AsnElement& element) {
  const std::string offset_str = std::to_string(element.offset) + ":";
  out_ << std::setw(8) << offset_str << "d=" << element.depth
       << " hl=" << element.HeaderLength() << " l=" << element.ContentLength()
       << " " << element.header.ConstructedStr() << ": "
       << asn::TagName(element.header);
  const std::string content = asn::FormatContent(element);
  if (!content.empty()) {
    out_ << "  " << content;
  }
  out_ << "\n";
}

void TreePrinter::OnRegionError(const asn::WalkIssue& /*issue*/,
                                asn::BytesView region, size_t region_depth) {
  out_ << std::string(region_depth * 2, ' ')
       << "[HEX DUMP]: " << asn::VecBytesStringRepresentation(region) << "\n";
}

asn::WalkStatus PrintTree(std::ostream& out, asn::BytesView data,
                          uint64_t base_offset) {
  TreePrinter printer(out);
  return asn::WalkTree(data, base_offset, printer);
}

}  // namespace asnsig::cli
