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

#ifndef SPDFJOB_HH
#define SPDFJOB_HH

#include <spdf/Constants.h>
#include <spdf/DLL.h>
#include <spdf/SPDFLogger.hh>
#include <spdf/SPDFPasswordSource.hh>
#include <spdf/SPDFRunConfig.hh>
#include <spdf/SPDFRunReport.hh>
#include <spdf/SPDFStage.hh>

#include <memory>
#include <string>
#include <vector>

// One invocation of spdf: resolve the configuration, discover the work
// items, run every item through SPDFPipeline, and summarize. This is
// what the spdf executable does; it can also be driven directly.
class SPDFJob
{
  public:
    // Exit codes -- returned by getExitCode() after calling run()
    static int constexpr EXIT_ERROR = spdf_exit_error;
    static int constexpr EXIT_ITEM_FAILED = spdf_exit_item_failed;

    SPDF_DLL
    SPDFJob();

    // SETUP FUNCTIONS

    // Initialize from argv, which must be a null-terminated array of
    // null-terminated strings. The configuration file defaults to
    // spdf.conf next to the executable named by argv[0]. Throws
    // SPDFUsage for command-line errors. --help and --version print
    // their output and exit.
    SPDF_DLL
    void initializeFromArgv(char const* const argv[]);

    SPDF_DLL
    void setConfigFile(std::string const&);
    // Positional arguments: the optional input and output file.
    SPDF_DLL
    void addPositional(std::string const&);

    // Use the given logger instead of the default logger. The log file
    // named in the configuration is attached to this logger.
    SPDF_DLL
    void setLogger(std::shared_ptr<SPDFLogger>);
    SPDF_DLL
    std::shared_ptr<SPDFLogger> getLogger();

    // Where passwords for encrypted inputs come from. The default reads
    // them from standard input.
    SPDF_DLL
    void setPasswordSource(std::shared_ptr<SPDFPasswordSource>);

    // Replace the external-tool stages, for example to run without the
    // tools installed. By default the stages are created from the
    // configuration with SPDFExternalTools.
    SPDF_DLL
    void setStageSet(SPDFStageSet const&);

    // QUERY FUNCTIONS

    // The resolved configuration; valid after run() has started.
    SPDF_DLL
    SPDFRunConfig getConfig() const;

    SPDF_DLL
    std::shared_ptr<SPDFRunReport> getReport() const;

    // EXIT_ITEM_FAILED if at least one item failed, otherwise 0.
    SPDF_DLL
    int getExitCode() const;

    // RUN

    // Throws SPDFExc if the configuration can't be loaded or no work
    // items are found. Problems with individual items never throw;
    // they are in the report.
    SPDF_DLL
    void run();

  private:
    class Members;

    std::shared_ptr<Members> m;
};

#endif // SPDFJOB_HH
