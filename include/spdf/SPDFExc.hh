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

#ifndef SPDFEXC_HH
#define SPDFEXC_HH

#include <spdf/Constants.h>
#include <spdf/DLL.h>

#include <stdexcept>
#include <string>

// Run-level errors. Errors that concern a single work item never escape
// the orchestrator; they become Skipped or Failed items in the report.
// SPDFExc is thrown for the conditions that abort the whole run before
// processing starts: the configuration can't be bootstrapped
// (spdf_e_bootstrap) or batch discovery found nothing to do
// (spdf_e_discovery).
class SPDF_DLL_CLASS SPDFExc: public std::runtime_error
{
  public:
    SPDF_DLL
    SPDFExc(
        spdf_error_code_e error_code, std::string const& filename, std::string const& message);
    SPDF_DLL
    ~SPDFExc() noexcept override = default;

    // what() returns "filename: message", or just the message if there
    // is no filename. The accessors return the original values.
    SPDF_DLL
    spdf_error_code_e getErrorCode() const;
    SPDF_DLL
    std::string const& getFilename() const;
    SPDF_DLL
    std::string const& getMessageDetail() const;

  private:
    SPDF_DLL_PRIVATE
    static std::string createWhat(std::string const& filename, std::string const& message);

    spdf_error_code_e error_code;
    std::string filename;
    std::string message;
};

#endif // SPDFEXC_HH
