// Copyright (c) 2024-2026 The spdf authors
//
// This file is part of spdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SPDFCONFIGFILE_HH
#define SPDFCONFIGFILE_HH

#include <spdf/DLL.h>
#include <spdf/SPDFLogger.hh>
#include <spdf/SPDFRunConfig.hh>

#include <list>
#include <memory>
#include <string>
#include <vector>

// Reads the persisted KEY=VALUE configuration file and turns it into an
// SPDFRunConfig.
//
// One assignment per line. Blank lines and lines whose first
// non-blank character is '#' are ignored. A value may be enclosed in
// double quotes (in which \" and \\ are escapes) or single quotes.
// An unquoted value ends at the first white space, and only a comment
// may follow it. An empty value selects the key's documented default,
// and a later assignment to the same key replaces an earlier one.
// Unknown keys are reported through the logger and ignored. Syntax
// errors and invalid values throw SPDFExc with spdf_e_bootstrap.
class SPDFConfigFile
{
  public:
    // Load the configuration at config_path, first writing the
    // documented defaults there if the file does not exist.
    // positionals are the command-line arguments left over after
    // option parsing; they become the explicit input/output pair when
    // the file sets CLI_OVERRIDE=yes and there are exactly two of them.
    // Otherwise they are ignored with a warning.
    SPDF_DLL
    static SPDFRunConfig resolve(
        std::string const& config_path,
        std::vector<std::string> const& positionals,
        std::shared_ptr<SPDFLogger> logger);

    // Apply the assignments in lines on top of builder. filename is
    // used in messages only.
    SPDF_DLL
    static void parseLines(
        std::string const& filename,
        std::list<std::string> const& lines,
        SPDFRunConfig::Builder& builder,
        SPDFLogger& logger);

    // The text written to a missing configuration file: every key with
    // its default value and a description.
    SPDF_DLL
    static std::string defaultContents();

    // spdf.conf in the directory of argv0, or in the current directory
    // if argv0 has no directory part.
    SPDF_DLL
    static std::string defaultPath(char const* argv0);
};

#endif // SPDFCONFIGFILE_HH
