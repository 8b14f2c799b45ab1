/* File: options.hpp
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

#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <memory>
#include <string>
#include <vector>

namespace asnsig::cli {

namespace po = boost::program_options;

const char *const kInputFileTag = "input-file,i";
const char *const kInputFileTagL = "input-file";
const char *const kHelpTag = "help,h";
const char *const kHelpTagL = "help";
const char *const kSaveTag = "save,s";
const char *const kSaveTagL = "save";
const char *const kOutputTag = "output,o";
const char *const kOutputTagL = "output";
const char *const kListTag = "list,l";
const char *const kListTagL = "list";
const char *const kVerboseTag = "verbose,v";
const char *const kVerboseTagL = "verbose";
const char *const kError = "Error:";

class Options {
 public:
  Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger);

  /// @brief print usage if --help was passed
  [[nodiscard]] bool help() const;
  void PrintUsage() const;
  [[nodiscard]] bool AllMandatoryAreSet() const;
  [[nodiscard]] bool WrongParams() const { return wrong_params_; }

  [[nodiscard]] std::string GetInputFile() const;
  /// @brief true if --save or --output is set
  [[nodiscard]] bool SaveRequested() const;
  /// @brief --output value or the default file name
  [[nodiscard]] std::string GetOutputFile() const;
  [[nodiscard]] bool ListRequested() const;
  [[nodiscard]] bool Verbose() const;

 private:
  [[nodiscard]] std::string ResolvePath(const std::string &path) const;

  std::shared_ptr<spdlog::logger> log_;
  po::positional_options_description pos_opt_desc_;
  po::options_description description_;
  bool wrong_params_ = false;
  po::variables_map var_map_;
};

}  // namespace asnsig::cli
