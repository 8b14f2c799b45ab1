/* File: mapped_file.cpp
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

#include "mapped_file.hpp"

#include <boost/interprocess/exceptions.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

#include "common_defs.hpp"
#include "tr.hpp"

namespace asnsig::cli {

namespace bip = boost::interprocess;

MappedFile::MappedFile(const std::string& path) {
  std::error_code err_code;
  if (!std::filesystem::is_regular_file(path, err_code)) {
    throw std::runtime_error(trs("error opening file: ") + path);
  }
  const auto file_size = std::filesystem::file_size(path, err_code);
  if (err_code) {
    throw std::runtime_error(trs("error getting file stats: ") +
                             err_code.message());
  }
  if (file_size < kMinInputFileSize) {
    throw std::runtime_error(
      trs("file too small to contain ASN.1 structure"));
  }
  try {
    mapping_ = bip::file_mapping(path.c_str(), bip::read_only);
    region_ = bip::mapped_region(mapping_, bip::read_only);
  } catch (const bip::interprocess_exception& ex) {
    throw std::runtime_error(trs("error memory-mapping file: ") + ex.what());
  }
}

asn::BytesView MappedFile::View() const noexcept {
  return {static_cast<const unsigned char*>(region_.get_address()),
          region_.get_size()};
}

}  // namespace asnsig::cli
