/* File: asnsig.cpp
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

#include <libintl.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <clocale>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "cli_utils.hpp"
#include "key_size.hpp"
#include "mapped_file.hpp"
#include "options.hpp"
#include "signature_locator.hpp"
#include "tr.hpp"
#include "tree_printer.hpp"

int main(int argc, char* argv[]) {
  using asnsig::cli::tr;
  using asnsig::cli::trs;
  // setup the transtlator
  if (setlocale(LC_ALL, "") == nullptr) {  // NOLINT
    std::cerr << "Failed to set locale.\n";
  }
  bindtextdomain(TRANSLATION_DOMAIN, TRANSLATIONS_INSTALL_DIR);
  bind_textdomain_codeset(TRANSLATION_DOMAIN, "UTF-8");
  textdomain(TRANSLATION_DOMAIN);
  try {
    // ----------------
    // setup logging
    auto console = spdlog::stdout_color_mt(TRANSLATION_DOMAIN);
    const asnsig::cli::Options options(argc, argv, console);
    if (options.WrongParams()) {
      options.PrintUsage();
      return 1;
    }
    if (options.help()) {
      return 0;
    }
    if (options.Verbose()) {
      spdlog::set_level(spdlog::level::debug);
    }
    if (options.ListRequested()) {
      asnsig::cli::PrintOidList(std::cout);
      return 0;
    }
    if (!options.AllMandatoryAreSet()) {
      options.PrintUsage();
      return 1;
    }
    const std::string input_file = options.GetInputFile();
    if (!asnsig::cli::CheckInputFile(input_file, console)) {
      return 1;
    }
    const asnsig::cli::MappedFile mapped_file(input_file);
    std::cout << tr("Analyzing file:") << " " << input_file << "\n";
    std::cout << asnsig::cli::kSeparator << "\n";
    // ----------------
    // search
    const asnsig::asn::SignatureMatch match =
      asnsig::asn::LocateSignature(mapped_file.View());
    asnsig::cli::PrintMatchSummary(std::cout, match);
    const uint64_t key_size = asnsig::asn::EstimateKeySize(match.FullBytes());
    asnsig::cli::PrintValidation(std::cout, match.Validation());
    std::cout << asnsig::cli::kSeparator << "\n";
    const auto status =
      asnsig::cli::PrintTree(std::cout, match.FullBytes(), match.Offset());
    if (!status.Ok()) {
      console->debug(trs("Regions not decoded: ") +
                     std::to_string(status.issues.size()));
    }
    asnsig::cli::PrintKeySize(std::cout, key_size);
    std::cout << asnsig::cli::kSeparator << "\n";
    // ----------------
    // save
    if (options.SaveRequested()) {
      const std::string output_file = options.GetOutputFile();
      if (!asnsig::cli::SaveToFile(match.FullBytes(), output_file, console)) {
        return 1;
      }
      std::cout << tr("ASN.1 structure saved to:") << " " << output_file
                << "\n";
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << tr(asnsig::cli::kError) << " " << ex.what() << "\n";
    return 1;
  }
}
