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

#ifndef SPDFSTAGE_HH
#define SPDFSTAGE_HH

#include <spdf/Constants.h>
#include <spdf/DLL.h>

#include <memory>
#include <string>
#include <vector>

// What a stage is asked to do. input is the current working artifact.
// output is where the stage should write its result; for the
// attachment stage it is the directory that receives extracted files,
// and for the metadata stage, which works in place, it equals input.
// password is only set for unlock and relock. scratch_dir is a
// directory private to the work item.
struct SPDFStageRequest
{
    std::string input;
    std::string output;
    std::string password;
    std::string scratch_dir;
};

struct SPDFStageResult
{
    enum status_e {
        st_applied,
        st_applied_with_warning,
        st_skipped,
        st_failed,
    };

    SPDF_DLL
    static SPDFStageResult applied(std::string const& artifact);
    SPDF_DLL
    static SPDFStageResult appliedWithWarning(
        std::string const& artifact, std::string const& detail);
    SPDF_DLL
    static SPDFStageResult skipped(std::string const& detail);
    SPDF_DLL
    static SPDFStageResult failed(std::string const& detail);

    bool
    ok() const
    {
        return (status == st_applied) || (status == st_applied_with_warning);
    }

    status_e status{st_failed};
    // the artifact produced by the stage
    std::string artifact;
    // warning text, skip reason, or failure cause
    std::string detail;
    // files extracted by the attachment stage
    std::vector<std::string> attachments;
};

// One sanitization transform. Implementations must not throw from run:
// every problem, including failure to start a program, is reported as
// a failed result with a readable cause.
class SPDF_DLL_CLASS SPDFStage
{
  public:
    SPDF_DLL
    virtual ~SPDFStage() = default;

    virtual SPDFStageResult run(SPDFStageRequest const&) = 0;

    // "unlock", "sanitize", "attachment strip", "metadata strip",
    // "rewrite", or "relock"
    SPDF_DLL
    static char const* stageName(spdf_stage_e);
};

class SPDF_DLL_CLASS SPDFEncryptionProbe
{
  public:
    enum result_e {
        pr_not_encrypted,
        pr_encrypted,
        pr_error,
    };

    SPDF_DLL
    virtual ~SPDFEncryptionProbe() = default;

    // detail is set for pr_error. Must not throw.
    virtual result_e probe(std::string const& path, std::string& detail) = 0;
};

// The complete set of transforms the orchestrator drives.
struct SPDFStageSet
{
    std::shared_ptr<SPDFEncryptionProbe> probe;
    std::shared_ptr<SPDFStage> unlock;
    std::shared_ptr<SPDFStage> sanitize;
    std::shared_ptr<SPDFStage> attachments;
    std::shared_ptr<SPDFStage> metadata;
    std::shared_ptr<SPDFStage> rewrite;
    std::shared_ptr<SPDFStage> relock;
};

#endif // SPDFSTAGE_HH
