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

// Generalized output interface. By convention, subclasses of Pipeline
// are called Pl_Something.
//
// spdf writes every piece of console and log output through pipelines:
// the logger's channels, the captured output of external tools and the
// digest computation over finished documents all end in a Pipeline.
//
// A pipeline created with a pointer to a next pipeline passes its data
// on to that pipeline. The allocator of a pipeline is responsible for
// its destruction; one pipeline object does not manage the memory of
// its successor.
//
// Call finish() before destroying a pipeline to avoid loss of data. A
// pipeline does not throw from its destructor if this hasn't been done.

#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <spdf/DLL.h>

#include <cstddef>
#include <memory>
#include <string>

// Remember to use SPDF_DLL_CLASS on anything derived from Pipeline so
// it will work with dynamic_cast across the shared object boundary.
class SPDF_DLL_CLASS Pipeline
{
  public:
    SPDF_DLL
    Pipeline(char const* identifier, Pipeline* next);

    SPDF_DLL
    virtual ~Pipeline() = default;

    // Subclasses implement write and finish and, if they are not
    // end-of-line pipelines, call next()->write or next()->finish.
    SPDF_DLL
    virtual void write(unsigned char const* data, size_t len) = 0;
    SPDF_DLL
    virtual void finish() = 0;
    SPDF_DLL
    std::string getIdentifier() const;

    // Convenience methods for writing other kinds of data without
    // casting. The char const* versions expect null-terminated strings
    // and do not write the terminator.
    SPDF_DLL
    void writeCStr(char const* cstr);
    SPDF_DLL
    void writeString(std::string const&);
    // This allows *p << "x" << name but is not a general purpose
    // ostream replacement.
    SPDF_DLL
    Pipeline& operator<<(char const* cstr);
    SPDF_DLL
    Pipeline& operator<<(std::string const&);

    // Overloaded write to reduce casting
    SPDF_DLL
    void write(char const* data, size_t len);

  protected:
    Pipeline*
    next() const noexcept
    {
        return next_;
    }
    std::string identifier;

  private:
    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;

    Pipeline* next_;
};

#endif // PIPELINE_HH
