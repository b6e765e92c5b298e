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

#ifndef PL_STRING_HH
#define PL_STRING_HH

#include <spdf/Pipeline.hh>

#include <string>

// This pipeline accumulates the data passed to it into a std::string, a
// reference to which is passed in at construction. Each use appends to
// the data accumulated so far. The process runner collects the output
// of external tools with it, and tests use it to capture log output.
//
// "next" may be null. If a next pointer is provided, this pipeline also
// passes the data through to it and forwards finish() to it.
class SPDF_DLL_CLASS Pl_String: public Pipeline
{
  public:
    SPDF_DLL
    Pl_String(char const* identifier, Pipeline* next, std::string& s);
    SPDF_DLL
    ~Pl_String() override;

    SPDF_DLL
    void write(unsigned char const* buf, size_t len) override;
    SPDF_DLL
    void finish() override;

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_STRING_HH
