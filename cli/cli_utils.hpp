/* File: cli_utils.hpp
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

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "field_extractor.hpp"
#include "logger_utils.hpp"
#include "signature_locator.hpp"
#include "typedefs.hpp"

namespace asnsig::cli {

constexpr const char* const kSeparator =
  "========================================";

/**
 * @brief Check the input file - existing, regular, not too small
 *
 * @param file filename
 * @param log logger
 * @return true if the file is ok
 */
bool CheckInputFile(const std::string& file,
                    const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Print offset and size of the found structure
 */
void PrintMatchSummary(std::ostream& out, const asn::SignatureMatch& match);

/**
 * @brief Print attributes found and the verdict
 * @details One line per attribute "  <Name>: true (<value>)" or
 * "  <Name>: false"
 */
void PrintValidation(std::ostream& out, const asn::ValidationResult& res);

void PrintKeySize(std::ostream& out, uint64_t key_size);

/// @brief Print all known OIDs and their total number
void PrintOidList(std::ostream& out);

/**
 * @brief Write bytes to a file
 *
 * @param data bytes to save
 * @param filename destination, truncated if exists
 * @param log logger
 * @return true on success
 */
bool SaveToFile(asn::BytesView data, const std::string& filename,
                const std::shared_ptr<spdlog::logger>& log);

}  // namespace asnsig::cli
