#include <spdf/SPDFStage.hh>

#include <stdexcept>

SPDFStageResult
SPDFStageResult::applied(std::string const& artifact)
{
    SPDFStageResult r;
    r.status = st_applied;
    r.artifact = artifact;
    return r;
}

SPDFStageResult
SPDFStageResult::appliedWithWarning(std::string const& artifact, std::string const& detail)
{
    SPDFStageResult r;
    r.status = st_applied_with_warning;
    r.artifact = artifact;
    r.detail = detail;
    return r;
}

SPDFStageResult
SPDFStageResult::skipped(std::string const& detail)
{
    SPDFStageResult r;
    r.status = st_skipped;
    r.detail = detail;
    return r;
}

SPDFStageResult
SPDFStageResult::failed(std::string const& detail)
{
    SPDFStageResult r;
    r.status = st_failed;
    r.detail = detail;
    return r;
}

char const*
SPDFStage::stageName(spdf_stage_e stage)
{
    switch (stage) {
    case spdf_stage_unlock:
        return "unlock";
    case spdf_stage_sanitize:
        return "sanitize";
    case spdf_stage_attachments:
        return "attachment strip";
    case spdf_stage_metadata:
        return "metadata strip";
    case spdf_stage_rewrite:
        return "rewrite";
    case spdf_stage_relock:
        return "relock";
    }
    throw std::logic_error("SPDFStage: invalid stage");
}
