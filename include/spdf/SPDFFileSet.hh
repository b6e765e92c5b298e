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

#ifndef SPDFFILESET_HH
#define SPDFFILESET_HH

#include <spdf/DLL.h>
#include <spdf/SPDFRunConfig.hh>

#include <string>
#include <vector>

// One input/output pair. index is the position in the resolved order;
// relative_dir is the subdirectory below the input directory in which
// the input was found, empty at the top level and in single-file mode.
struct SPDFWorkItem
{
    size_t index{0};
    std::string input;
    std::string output;
    std::string relative_dir;
};

class SPDFFileSet
{
  public:
    // Produce the work items for config. With an explicit pair there is
    // exactly one item. Otherwise every regular file below the input
    // directory whose name matches the file pattern becomes an item,
    // ordered by path. Output directories are created unless the
    // configuration requests a dry run. Throws SPDFExc with
    // spdf_e_discovery if the input directory doesn't exist or nothing
    // matches.
    SPDF_DLL
    static std::vector<SPDFWorkItem> resolve(SPDFRunConfig const& config);

    // Return the output paths that more than one item would write,
    // each once.
    SPDF_DLL
    static std::vector<std::string> duplicateOutputs(std::vector<SPDFWorkItem> const& items);
};

#endif // SPDFFILESET_HH
