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

#ifndef SPDFPIPELINE_HH
#define SPDFPIPELINE_HH

#include <spdf/DLL.h>
#include <spdf/SPDFFileSet.hh>
#include <spdf/SPDFLogger.hh>
#include <spdf/SPDFPasswordSource.hh>
#include <spdf/SPDFRunConfig.hh>
#include <spdf/SPDFRunReport.hh>
#include <spdf/SPDFStage.hh>

#include <memory>

// Drives one work item through the sanitization stages.
//
// For each item, process() walks a fixed sequence of states: the
// encryption check (prompting for and applying a password if needed),
// sanitize, attachment strip, metadata strip, rewrite, the optional
// relock, and cleanup. The state of an item lives only for the
// duration of the call. Items never influence each other, and
// process() never throws: whatever happens is described by the
// returned report.
//
// Terminal states:
//   succeeded -- rewrite produced the output; relock problems are only
//                warnings
//   skipped   -- an encrypted input couldn't be unlocked because no
//                password arrived in time, none was available, or it
//                was wrong; nothing is written
//   failed    -- the input couldn't be read, the encryption check or a
//                mandatory stage failed, or an unexpected error
//                occurred
//
// Once the encryption check has started, the item's private working
// directory is removed whatever the outcome.
class SPDFPipeline
{
  public:
    SPDF_DLL
    SPDFPipeline(
        SPDFRunConfig const& config,
        SPDFStageSet const& stages,
        std::shared_ptr<SPDFPasswordSource> passwords,
        std::shared_ptr<SPDFLogger> logger);

    SPDF_DLL
    SPDFItemReport process(SPDFWorkItem const& item);

  private:
    class Members;

    std::shared_ptr<Members> m;
};

#endif // SPDFPIPELINE_HH
