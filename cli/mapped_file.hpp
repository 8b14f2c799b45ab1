/* File: mapped_file.hpp
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

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include <string>

#include "typedefs.hpp"

namespace asnsig::cli {

/**
 * @brief A file mapped read-only to memory
 * @details The mapping lives as long as the object, views returned by View()
 * must not outlive it.
 */
class MappedFile {
 public:
  /**
   * @brief Map the file
   * @param path
   * @throws std::runtime_error if the file is missing, too small or can not be
   * mapped
   */
  explicit MappedFile(const std::string& path);

  [[nodiscard]] asn::BytesView View() const noexcept;

 private:
  boost::interprocess::file_mapping mapping_;
  boost::interprocess::mapped_region region_;
};

}  // namespace asnsig::cli
