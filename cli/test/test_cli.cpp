/* File: test_cli.cpp
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

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "cli_utils.hpp"
#include "common_defs.hpp"
#include "field_extractor.hpp"
#include "logger_utils.hpp"
#include "mapped_file.hpp"
#include "oid_table.hpp"
#include "options.hpp"
#include "signature_locator.hpp"
#include "test_helpers.hpp"
#include "tree_printer.hpp"

using namespace asnsig;
using namespace asnsig::asn::test;

namespace {

// argv for boost::program_options
class ArgList {
 public:
  explicit ArgList(std::vector<std::string> args) : args_(std::move(args)) {
    for (auto &arg : args_) {
      ptrs_.push_back(arg.data());
    }
    ptrs_.push_back(nullptr);
    argv_ = ptrs_.data();
  }
  int Argc() const { return static_cast<int>(args_.size()); }
  char **&Argv() { return argv_; }

 private:
  std::vector<std::string> args_;
  std::vector<char *> ptrs_;
  char **argv_ = nullptr;
};

void WriteFile(const std::string &path, const asn::BytesVector &data) {
  std::ofstream ofile(path, std::ios_base::binary | std::ios_base::trunc);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  ofile.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

} // namespace

TEST_CASE("Tree printing") {
  SECTION("Elements") {
    const asn::BytesVector data{0x30, 0x03, 0x02, 0x01, 0x42};
    std::stringstream out;
    auto status = cli::PrintTree(out, asn::BytesView(data), 0);
    REQUIRE(status.Ok());
    REQUIRE(out.str() == "      0:d=0 hl=2 l=3 cons: SEQUENCE\n"
                         "      2:d=1 hl=2 l=1 prim: INTEGER  66 (0x42)\n");
  }

  SECTION("Absolute offsets") {
    const asn::BytesVector data = Tlv(0x13, Str("US"));
    std::stringstream out;
    auto status = cli::PrintTree(out, asn::BytesView(data), 1234);
    REQUIRE(status.Ok());
    REQUIRE(out.str() ==
            "   1234:d=0 hl=2 l=2 prim: PRINTABLE STRING  \"US\"\n");
  }

  SECTION("Broken region is dumped") {
    const asn::BytesVector data{0x30, 0x08, 0x30, 0x03, 0x02, 0x05,
                                0x01, 0x02, 0x01, 0x07};
    std::stringstream out;
    auto status = cli::PrintTree(out, asn::BytesView(data), 0);
    REQUIRE_FALSE(status.Ok());
    REQUIRE(out.str() == "      0:d=0 hl=2 l=8 cons: SEQUENCE\n"
                         "      2:d=1 hl=2 l=3 cons: SEQUENCE\n"
                         "    [HEX DUMP]: 020501\n"
                         "      7:d=1 hl=2 l=1 prim: INTEGER  7 (0x07)\n");
  }
}

TEST_CASE("Report") {
  SECTION("Validation") {
    const asn::BytesVector name = SignerName();
    auto res = asn::ExtractFields(asn::BytesView(name));
    std::stringstream out;
    cli::PrintValidation(out, res);
    const std::string text = out.str();
    REQUIRE(text.find(cli::kSeparator) == 0);
    REQUIRE(text.find("Signature Validation:\n") != std::string::npos);
    REQUIRE(text.find("  Common Name: true (Example Signer)\n") !=
            std::string::npos);
    REQUIRE(text.find("  Email Address: true (signer@example.com)\n") !=
            std::string::npos);
    REQUIRE(text.find("Valid signature - all required fields present") !=
            std::string::npos);

    res.emailAddress.reset();
    std::stringstream out_invalid;
    cli::PrintValidation(out_invalid, res);
    REQUIRE(out_invalid.str().find("  Email Address: false\n") !=
            std::string::npos);
    REQUIRE(out_invalid.str().find(
              "Invalid signature - missing required fields") !=
            std::string::npos);
  }

  SECTION("Match summary") {
    const asn::BytesVector buffer =
      Concat({asn::BytesVector(16, 0x00), SignatureBlob()});
    auto match = asn::LocateSignature(asn::BytesView(buffer));
    std::stringstream out;
    cli::PrintMatchSummary(out, match);
    REQUIRE(out.str() ==
            "Valid ASN.1 signature found at offset 16\n"
            "Structure size: " +
              std::to_string(buffer.size() - 16) + " bytes\n");
  }

  SECTION("Key size") {
    std::stringstream out;
    cli::PrintKeySize(out, 2048);
    REQUIRE(out.str() == "Key size calculation: 2048 bits\n");
    std::stringstream out_na;
    cli::PrintKeySize(out_na, 0);
    REQUIRE(out_na.str() ==
            "Key size calculation: N/A (no OCTET STRING found as final "
            "element)\n");
  }

  SECTION("OID list") {
    std::stringstream out;
    cli::PrintOidList(out);
    const std::string text = out.str();
    REQUIRE(text.find("Supported OIDs:\n") == 0);
    REQUIRE(text.find("  2.5.4.3  commonName\n") != std::string::npos);
    REQUIRE(text.find("Total supported OIDs: " +
                      std::to_string(asn::KnownOids().size()) + "\n") !=
            std::string::npos);
  }
}

TEST_CASE("Files") {
  auto log = logger::InitLog();
  REQUIRE(log);
  REQUIRE(std::filesystem::exists(TEST_DIR));

  SECTION("Save and map") {
    const asn::BytesVector blob = SignatureBlob();
    const std::string file = std::string(TEST_DIR) + "saved_signature.der";
    REQUIRE(cli::SaveToFile(asn::BytesView(blob), file, log));
    REQUIRE(std::filesystem::file_size(file) == blob.size());
    REQUIRE(cli::CheckInputFile(file, log));
    const cli::MappedFile mapped(file);
    REQUIRE(mapped.View().ToVector() == blob);
    auto match = asn::LocateSignature(mapped.View());
    REQUIRE(match.Offset() == 0);
    std::filesystem::remove(file);
  }

  SECTION("Save to a missing directory") {
    const asn::BytesVector blob{0x01, 0x02};
    REQUIRE_FALSE(cli::SaveToFile(
      asn::BytesView(blob), std::string(TEST_DIR) + "no_such_dir/out.der",
      log));
  }

  SECTION("Too small file") {
    const std::string file = std::string(TEST_DIR) + "tiny.bin";
    WriteFile(file, {0x30, 0x82, 0x00});
    REQUIRE_FALSE(cli::CheckInputFile(file, log));
    REQUIRE_THROWS_AS(cli::MappedFile(file), std::runtime_error);
    std::filesystem::remove(file);
  }

  SECTION("Missing file") {
    const std::string file = std::string(TEST_DIR) + "no_such_file.bin";
    REQUIRE_FALSE(cli::CheckInputFile(file, log));
    REQUIRE_THROWS_AS(cli::MappedFile(file), std::runtime_error);
    REQUIRE_FALSE(cli::CheckInputFile(TEST_DIR, log));
  }
}

TEST_CASE("Options") {
  auto log = logger::InitLog();
  REQUIRE(log);

  SECTION("Input file only") {
    ArgList args({"asnsig", "/tmp/input.exe"});
    const cli::Options opts(args.Argc(), args.Argv(), log);
    REQUIRE_FALSE(opts.WrongParams());
    REQUIRE_FALSE(opts.help());
    REQUIRE(opts.AllMandatoryAreSet());
    REQUIRE(opts.GetInputFile() == "/tmp/input.exe");
    REQUIRE_FALSE(opts.SaveRequested());
    REQUIRE_FALSE(opts.ListRequested());
    REQUIRE_FALSE(opts.Verbose());
    REQUIRE(opts.GetOutputFile() == kDefaultOutputFile);
  }

  SECTION("Save with the default name") {
    ArgList args({"asnsig", "-s", "-v", "/tmp/input.exe"});
    const cli::Options opts(args.Argc(), args.Argv(), log);
    REQUIRE(opts.AllMandatoryAreSet());
    REQUIRE(opts.SaveRequested());
    REQUIRE(opts.Verbose());
    REQUIRE(opts.GetOutputFile() == "signature.der");
  }

  SECTION("Output file") {
    ArgList args({"asnsig", "--output", "out.der", "--input-file",
                  "/tmp/input.exe"});
    const cli::Options opts(args.Argc(), args.Argv(), log);
    REQUIRE(opts.SaveRequested());
    REQUIRE(opts.GetOutputFile() == "out.der");
    REQUIRE(opts.GetInputFile() == "/tmp/input.exe");
  }

  SECTION("Relative path") {
    ArgList args({"asnsig", "./input.exe"});
    const cli::Options opts(args.Argc(), args.Argv(), log);
    REQUIRE(opts.GetInputFile() ==
            (std::filesystem::current_path() / "input.exe").string());
  }

  SECTION("List without input") {
    ArgList args({"asnsig", "-l"});
    const cli::Options opts(args.Argc(), args.Argv(), log);
    REQUIRE(opts.ListRequested());
    REQUIRE_FALSE(opts.AllMandatoryAreSet());
    REQUIRE(opts.GetInputFile().empty());
  }

  SECTION("Two input files") {
    ArgList args({"asnsig", "a.bin", "b.bin"});
    const cli::Options opts(args.Argc(), args.Argv(), log);
    REQUIRE_FALSE(opts.WrongParams());
    REQUIRE_FALSE(opts.AllMandatoryAreSet());
  }

  SECTION("Unknown option") {
    ArgList args({"asnsig", "--no-such-option", "a.bin"});
    const cli::Options opts(args.Argc(), args.Argv(), log);
    REQUIRE(opts.WrongParams());
  }
}
