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

#ifndef SPDFUSAGE_HH
#define SPDFUSAGE_HH

#include <spdf/DLL.h>

#include <stdexcept>
#include <string>

// Thrown for command-line errors. The CLI prints the message together
// with pointers to --help and exits with spdf_exit_error.
class SPDF_DLL_CLASS SPDFUsage: public std::runtime_error
{
  public:
    SPDF_DLL
    SPDFUsage(std::string const& msg);
    SPDF_DLL
    ~SPDFUsage() noexcept override = default;
};

#endif // SPDFUSAGE_HH
