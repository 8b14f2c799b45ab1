/* File: options.cpp
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

#include "options.hpp"

#include "common_defs.hpp"
#include "tr.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace asnsig::cli {

Options::Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger)
  : log_(std::move(logger)), description_(tr("Allowed options")) {
  description_.add_options()
    // clang-format off
      (kHelpTag, tr("produce this help message"))
      (kInputFileTag, po::value<std::vector<std::string>>(),tr("input file"))
      (kSaveTag, tr("save ASN.1 structure to file (default: signature.der)"))
      (kOutputTag,po::value<std::string>(),tr("output file to save the ASN.1 structure"))
      (kListTag, tr("list supported OIDs"))
      (kVerboseTag, tr("verbose logging"));
  // clang-format on
  try {
    pos_opt_desc_.add(kInputFileTagL, -1);
    po::store(po::command_line_parser(argc, argv)
                .options(description_)
                .positional(pos_opt_desc_)
                .run(),
              var_map_);
    po::notify(var_map_);
  } catch (
    const boost::wrapexcept<boost::program_options::invalid_command_line_syntax>
      & /*ex*/) {
    log_->error(tr("Wrong parameters, see --help"));
    wrong_params_ = true;
  } catch (const boost::wrapexcept<boost::program_options::unknown_option> &ex) {
    log_->error(trs("Unknown option passed.") + ex.what());
    wrong_params_ = true;
  } catch (
    const boost::wrapexcept<boost::program_options::ambiguous_option> & /*ex*/) {
    wrong_params_ = true;
    log_->error(
      tr("Ambiguous option passed,use - for short options and -- "
         "for full otions,--help for help"));
  }
}

bool Options::help() const {
  if (var_map_.count(kHelpTagL) > 0) {
    PrintUsage();
    return true;
  }
  return false;
}

void Options::PrintUsage() const {
  std::cout << tr("Search for ASN.1 structures (0x30 0x82) from end of file "
                  "backwards")
            << "\n";
  // clang-format off
  std::cout << tr("Usage") << ": "
            << TRANSLATION_DOMAIN << " "
            << "[options] <file_path>\n";
  std::cout << description_ << "\n";
  // clang-format on
}

std::string Options::ResolvePath(const std::string &path) const {
  std::string local_path = path;
  std::string current_path = std::filesystem::current_path();
  current_path += "/";
  const char *home = getenv("HOME");  // NOLINT
  if (local_path.empty() || local_path == ".") {
    local_path = std::filesystem::current_path();
  }
  if (boost::starts_with(local_path, "./")) {
    boost::replace_first(local_path, "./", current_path);
  }
  if (home != nullptr && boost::starts_with(local_path, "~/")) {
    std::string home_path = home;
    home_path += "/";
    boost::replace_first(local_path, "~/", home_path);
  }
  std::filesystem::path fs_path = local_path;
  std::error_code err_code;
  fs_path = std::filesystem::absolute(fs_path, err_code);
  if (err_code) {
    log_->error(err_code.message());
  }
  local_path = fs_path;
  return local_path;
}

bool Options::AllMandatoryAreSet() const {
  if (var_map_.count(kInputFileTagL) == 0) {
    log_->error(tr("No input file is set"));
    return false;
  }
  if (var_map_.at(kInputFileTagL).as<std::vector<std::string>>().size() != 1) {
    log_->error(tr("please provide exactly one file path"));
    return false;
  }
  if (var_map_.count(kOutputTagL) > 0 &&
      var_map_.at(kOutputTagL).as<std::string>().empty()) {
    log_->error(tr("Output file name is empty"));
    return false;
  }
  return true;
}

std::string Options::GetInputFile() const {
  if (var_map_.count(kInputFileTagL) == 0) {
    return {};
  }
  const auto files_list =
    var_map_.at(kInputFileTagL).as<std::vector<std::string>>();
  if (files_list.empty()) {
    return {};
  }
  return ResolvePath(files_list.front());
}

bool Options::SaveRequested() const {
  return var_map_.count(kSaveTagL) > 0 || var_map_.count(kOutputTagL) > 0;
}

std::string Options::GetOutputFile() const {
  if (var_map_.count(kOutputTagL) == 0) {
    return kDefaultOutputFile;
  }
  return var_map_.at(kOutputTagL).as<std::string>();
}

bool Options::ListRequested() const { return var_map_.count(kListTagL) > 0; }

bool Options::Verbose() const { return var_map_.count(kVerboseTagL) > 0; }

}  // namespace asnsig::cli
