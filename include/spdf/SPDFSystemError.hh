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

#ifndef SPDFSYSTEMERROR_HH
#define SPDFSYSTEMERROR_HH

#include <spdf/DLL.h>

#include <stdexcept>
#include <string>

class SPDF_DLL_CLASS SPDFSystemError: public std::runtime_error
{
  public:
    SPDF_DLL
    SPDFSystemError(std::string const& description, int system_errno);
    SPDF_DLL
    ~SPDFSystemError() noexcept override = default;

    // Accessor to retrieve the original description and errno. what()
    // combines the description with strerror(errno).
    SPDF_DLL
    std::string const& getDescription() const;
    SPDF_DLL
    int getErrno() const;

  private:
    SPDF_DLL_PRIVATE
    static std::string createWhat(std::string const& description, int system_errno);

    std::string description;
    int system_errno;
};

#endif // SPDFSYSTEMERROR_HH
