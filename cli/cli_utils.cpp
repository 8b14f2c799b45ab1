/* File: cli_utils.cpp
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

#include "cli_utils.hpp"

#include <filesystem>
#include <fstream>
#include <ios>
#include <ostream>
#include <string>
#include <system_error>

#include "common_defs.hpp"
#include "oid_table.hpp"
#include "tr.hpp"

namespace asnsig::cli {

namespace {

void PrintField(std::ostream& out, const char* name,
                const asn::OptString& value) {
  out << "  " << name << ": " << (value ? "true" : "false");
  if (value && !value->empty()) {
    out << " (" << value.value() << ")";
  }
  out << "\n";
}

}  // namespace

bool CheckInputFile(const std::string& file,
                    const std::shared_ptr<spdlog::logger>& log) {
  std::error_code err_code;
  if (!std::filesystem::exists(file, err_code)) {
    log->error(trs("File not found") + " " + file);
    return false;
  }
  if (!std::filesystem::is_regular_file(file, err_code)) {
    log->error(trs("This file is not a regular file") + " " + file);
    return false;
  }
  const auto file_size = std::filesystem::file_size(file, err_code);
  if (err_code) {
    log->error(err_code.message());
    return false;
  }
  if (file_size < kMinInputFileSize) {
    log->error(trs("File is empty or too small") + " " + file);
    return false;
  }
  return true;
}

void PrintMatchSummary(std::ostream& out, const asn::SignatureMatch& match) {
  out << tr("Valid ASN.1 signature found at offset") << " " << match.Offset()
      << "\n";
  out << tr("Structure size:") << " " << match.FullBytes().size() << " "
      << tr("bytes") << "\n";
}

void PrintValidation(std::ostream& out, const asn::ValidationResult& res) {
  out << kSeparator << "\n";
  out << tr("Signature Validation:") << "\n";
  PrintField(out, tr("Common Name"), res.commonName);
  PrintField(out, tr("Country Name"), res.countryName);
  PrintField(out, tr("Locality Name"), res.localityName);
  PrintField(out, tr("Organization Name"), res.organizationName);
  PrintField(out, tr("Email Address"), res.emailAddress);
  if (res.IsValid()) {
    out << tr("Valid signature - all required fields present") << "\n";
  } else {
    out << tr("Invalid signature - missing required fields") << "\n";
  }
}

void PrintKeySize(std::ostream& out, uint64_t key_size) {
  out << tr("Key size calculation:") << " ";
  if (key_size > 0) {
    out << key_size << " " << tr("bits") << "\n";
  } else {
    out << tr("N/A (no OCTET STRING found as final element)") << "\n";
  }
}

void PrintOidList(std::ostream& out) {
  const auto& oids = asn::KnownOids();
  out << tr("Supported OIDs:") << "\n";
  for (const auto& [oid, name] : oids) {
    out << "  " << oid << "  " << name << "\n";
  }
  out << tr("Total supported OIDs:") << " " << oids.size() << "\n";
}

bool SaveToFile(asn::BytesView data, const std::string& filename,
                const std::shared_ptr<spdlog::logger>& log) {
  std::ofstream ofile(filename, std::ios_base::binary | std::ios_base::trunc);
  if (!ofile.is_open()) {
    log->error(trs("failed to create file") + " " + filename);
    return false;
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  ofile.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
  ofile.close();
  if (ofile.fail()) {
    log->error(trs("failed to write data") + " " + filename);
    return false;
  }
  return true;
}

}  // namespace asnsig::cli
