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

#ifndef SPDFEXTERNALTOOLS_HH
#define SPDFEXTERNALTOOLS_HH

#include <spdf/DLL.h>
#include <spdf/SPDFRunConfig.hh>
#include <spdf/SPDFStage.hh>

#include <string>

// Stages implemented by running qpdf, pdfdetach, exiftool, and
// Ghostscript. Program locations, metadata arguments, quality tier, and
// encryption strength come from the configuration.
//
// Passwords are always passed on standard input: unlock uses qpdf's
// --password-file=- and relock reads its whole argument list from
// standard input with @-, one argument per line. A password containing
// a newline therefore can't be used.
class SPDFExternalTools
{
  public:
    SPDF_DLL
    static SPDFStageSet create(SPDFRunConfig const& config);

    // Map a tool's exit status and output to a stage result. status 0
    // is success, unless an output line starts with "Warning", which
    // makes it success with a warning. For qpdf, status 3 is success
    // with warnings. Anything else fails with a cause that names the
    // tool, the status, and the last line of its error output.
    SPDF_DLL
    static SPDFStageResult interpretExit(
        std::string const& tool,
        bool is_qpdf,
        int status,
        std::string const& out,
        std::string const& err,
        std::string const& artifact);
};

#endif // SPDFEXTERNALTOOLS_HH
