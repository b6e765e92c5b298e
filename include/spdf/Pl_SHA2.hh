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

#ifndef PL_SHA2_HH
#define PL_SHA2_HH

#include <spdf/Pipeline.hh>

#include <memory>

// Computes a SHA-256 digest of the data passing through it using the
// GnuTLS hash API. It may be used as an end-of-line pipeline or in the
// middle of a chain. The digest is available after finish() has been
// called. Call reset() to compute another digest with the same object.
class SPDF_DLL_CLASS Pl_SHA2: public Pipeline
{
  public:
    SPDF_DLL
    Pl_SHA2(Pipeline* next = nullptr);
    SPDF_DLL
    ~Pl_SHA2() override;
    SPDF_DLL
    void write(unsigned char const*, size_t) override;
    SPDF_DLL
    void finish() override;
    SPDF_DLL
    void reset();
    SPDF_DLL
    std::string getRawDigest();
    SPDF_DLL
    std::string getHexDigest();

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_SHA2_HH
