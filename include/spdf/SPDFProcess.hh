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

#ifndef SPDFPROCESS_HH
#define SPDFPROCESS_HH

#include <spdf/DLL.h>
#include <spdf/Pipeline.hh>

#include <memory>
#include <string>
#include <vector>

// Runs an external program and waits for it. The program is looked up
// in PATH the way a shell would. Data given to setInput is written to
// its standard input, which is then closed; standard output and
// standard error are written to the given pipelines as they arrive.
// Output streams without a pipeline are discarded.
class SPDFProcess
{
  public:
    // exit status reported when the program could not be started
    static int constexpr exit_launch_failed = 127;

    SPDF_DLL
    SPDFProcess(std::vector<std::string> const& args);

    SPDF_DLL
    void setInput(std::string const& data);
    SPDF_DLL
    void setOutput(Pipeline*);
    SPDF_DLL
    void setError(Pipeline*);

    // Run the program to completion and return its exit status. A
    // program killed by a signal reports 128 + the signal number. If
    // the program can't be executed, a message is written to the error
    // pipeline and exit_launch_failed is returned. Failure to create
    // the pipes or the process throws SPDFSystemError.
    SPDF_DLL
    int run();

    // The argument list joined with spaces, for log messages.
    SPDF_DLL
    std::string getCommandLine() const;

  private:
    class Members;

    std::shared_ptr<Members> m;
};

#endif // SPDFPROCESS_HH
