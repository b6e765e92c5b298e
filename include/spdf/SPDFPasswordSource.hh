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

#ifndef SPDFPASSWORDSOURCE_HH
#define SPDFPASSWORDSOURCE_HH

#include <spdf/DLL.h>
#include <spdf/Pipeline.hh>

#include <memory>
#include <string>

// A bounded request for the password of one encrypted document. Every
// request ends in one of three ways: a password was provided, the
// timeout expired, or no password can be provided at all (for example
// because the input reached end of file).
class SPDF_DLL_CLASS SPDFPasswordSource
{
  public:
    enum response_e {
        pw_provided,
        pw_timed_out,
        pw_unavailable,
    };

    SPDF_DLL
    virtual ~SPDFPasswordSource() = default;

    // prompt identifies the document. The call returns no later than
    // timeout_seconds after it started. password is only set for
    // pw_provided.
    virtual response_e
    requestPassword(std::string const& prompt, int timeout_seconds, std::string& password) = 0;
};

// Reads one line from a file descriptor, by default standard input.
// The prompt is written to the given pipeline, standard error if none
// is given. If the descriptor is a terminal, echo is turned off while
// the password is typed. Input is read one byte at a time so nothing
// after the newline is consumed; later requests see the following
// lines.
class SPDF_DLL_CLASS SPDFTerminalPasswordSource: public SPDFPasswordSource
{
  public:
    SPDF_DLL
    SPDFTerminalPasswordSource(int fd = 0, std::shared_ptr<Pipeline> prompt_output = nullptr);
    SPDF_DLL
    ~SPDFTerminalPasswordSource() override;

    SPDF_DLL
    response_e requestPassword(
        std::string const& prompt, int timeout_seconds, std::string& password) override;

  private:
    class Members;

    std::shared_ptr<Members> m;
};

#endif // SPDFPASSWORDSOURCE_HH
