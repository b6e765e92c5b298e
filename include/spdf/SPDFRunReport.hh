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

#ifndef SPDFRUNREPORT_HH
#define SPDFRUNREPORT_HH

#include <spdf/DLL.h>
#include <spdf/SPDFFileSet.hh>
#include <spdf/SPDFLogger.hh>
#include <spdf/SPDFStage.hh>

#include <memory>
#include <string>
#include <vector>

// What happened to one stage of one work item. status is never
// st_failed: a failed stage ends the item and is recorded as the
// item's reason instead.
struct SPDFStageOutcome
{
    spdf_stage_e stage{spdf_stage_unlock};
    std::string started;
    std::string finished;
    SPDFStageResult::status_e status{SPDFStageResult::st_applied};
    std::string detail;
};

struct SPDFItemReport
{
    enum status_e {
        is_pending,
        is_in_progress,
        is_skipped,
        is_failed,
        is_succeeded,
    };

    SPDF_DLL
    static char const* statusName(status_e);

    SPDFWorkItem item;
    status_e status{is_pending};
    // why the item was skipped or failed; "would process" in a dry run
    std::string reason;
    std::vector<SPDFStageOutcome> stages;
    std::string started;
    std::string finished;
    // problems in best-effort steps that didn't change the status
    std::vector<std::string> warnings;
    bool relocked{false};
    // hex SHA-256 of the final output
    std::string digest;
};

// Collects item reports for a run. Safe to use from several threads.
class SPDFRunReport
{
  public:
    SPDF_DLL
    SPDFRunReport();

    SPDF_DLL
    void add(SPDFItemReport const&);
    SPDF_DLL
    std::vector<SPDFItemReport> getItems() const;
    SPDF_DLL
    size_t count(SPDFItemReport::status_e) const;
    SPDF_DLL
    bool hasFailures() const;

    // Log one line with the number of items in each terminal state and
    // one line per item that didn't succeed.
    SPDF_DLL
    void writeSummary(SPDFLogger&) const;

  private:
    class Members;

    std::shared_ptr<Members> m;
};

#endif // SPDFRUNREPORT_HH
