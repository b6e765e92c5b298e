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

// End-of-line pipeline that writes its data to a stdio FILE* object.
// The logger writes the durable run log through it.

#ifndef PL_STDIOFILE_HH
#define PL_STDIOFILE_HH

#include <spdf/Pipeline.hh>

#include <cstdio>

// This pipeline is reusable.
class SPDF_DLL_CLASS Pl_StdioFile: public Pipeline
{
  public:
    // f is externally maintained; this class just writes to and
    // flushes it. It does not close it.
    SPDF_DLL
    Pl_StdioFile(char const* identifier, FILE* f);
    SPDF_DLL
    ~Pl_StdioFile() override;

    SPDF_DLL
    void write(unsigned char const* buf, size_t len) override;
    SPDF_DLL
    void finish() override;

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_STDIOFILE_HH
