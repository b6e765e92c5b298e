#include <spdf/SPDFPipeline.hh>

#include <spdf/Pl_SHA2.hh>
#include <spdf/SUtil.hh>

#include <stdexcept>
#include <sys/stat.h>

namespace
{
    enum state_e {
        s_pending,
        s_encryption_check,
        s_sanitize,
        s_attachments,
        s_metadata,
        s_rewrite,
        s_relock,
        s_cleanup,
        s_done,
    };

    // Everything known about the item currently being processed.
    struct ItemState
    {
        ItemState(SPDFWorkItem const& item)
        {
            report.item = item;
        }

        state_e state{s_pending};
        std::string artifact;
        std::string password;
        bool have_password{false};
        std::string work_dir;
        SPDFItemReport report;
    };

    // dir/name, or dir/stem-N.ext for the smallest N that isn't taken.
    std::string
    unique_path(std::string const& dir, std::string const& name)
    {
        auto candidate = SUtil::path_join(dir, name);
        auto stem = SUtil::path_stem(name);
        auto ext = SUtil::path_extension(name);
        for (int i = 1; SUtil::file_exists(candidate); ++i) {
            candidate = SUtil::path_join(dir, stem + "-" + std::to_string(i) + ext);
        }
        return candidate;
    }
} // namespace

class SPDFPipeline::Members
{
  public:
    Members(
        SPDFRunConfig const& config,
        SPDFStageSet const& stages,
        std::shared_ptr<SPDFPasswordSource> passwords,
        std::shared_ptr<SPDFLogger> logger) :
        config(config),
        stages(stages),
        passwords(passwords),
        logger(logger)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    state_e pending(ItemState&);
    state_e encryptionCheck(ItemState&);
    state_e sanitize(ItemState&);
    state_e attachments(ItemState&);
    state_e metadata(ItemState&);
    state_e rewrite(ItemState&);
    state_e relock(ItemState&);
    state_e cleanup(ItemState&);

    state_e terminate(ItemState&, SPDFItemReport::status_e, std::string const& reason);
    bool runStage(
        ItemState&,
        spdf_stage_e,
        std::shared_ptr<SPDFStage>,
        SPDFStageRequest const&,
        SPDFStageResult& result);
    void recordSkip(ItemState&, spdf_stage_e, std::string const& detail);
    void warning(ItemState&, std::string const& msg);
    void snapshot(ItemState&, int step);
    void disposeAttachments(ItemState&, std::vector<std::string> const& files);
    void moveAttachments(
        ItemState&, std::vector<std::string> const& files, std::string const& dest_dir);
    std::string outputSibling(ItemState&, std::string const& suffix);

    SPDFRunConfig config;
    SPDFStageSet stages;
    std::shared_ptr<SPDFPasswordSource> passwords;
    std::shared_ptr<SPDFLogger> logger;
};

SPDFPipeline::SPDFPipeline(
    SPDFRunConfig const& config,
    SPDFStageSet const& stages,
    std::shared_ptr<SPDFPasswordSource> passwords,
    std::shared_ptr<SPDFLogger> logger) :
    m(new Members(config, stages, passwords, logger))
{
    if (!(stages.probe && stages.unlock && stages.sanitize && stages.attachments &&
          stages.metadata && stages.rewrite && stages.relock)) {
        throw std::logic_error("SPDFPipeline: incomplete stage set");
    }
    if (!(passwords && logger)) {
        throw std::logic_error("SPDFPipeline: null password source or logger");
    }
}

SPDFItemReport
SPDFPipeline::process(SPDFWorkItem const& item)
{
    ItemState st(item);
    st.report.started = SUtil::current_timestamp();
    st.report.status = SPDFItemReport::is_in_progress;

    while (st.state != s_done) {
        try {
            switch (st.state) {
            case s_pending:
                st.state = m->pending(st);
                break;
            case s_encryption_check:
                st.state = m->encryptionCheck(st);
                break;
            case s_sanitize:
                st.state = m->sanitize(st);
                break;
            case s_attachments:
                st.state = m->attachments(st);
                break;
            case s_metadata:
                st.state = m->metadata(st);
                break;
            case s_rewrite:
                st.state = m->rewrite(st);
                break;
            case s_relock:
                st.state = m->relock(st);
                break;
            case s_cleanup:
                st.state = m->cleanup(st);
                break;
            case s_done:
                break;
            }
        } catch (std::exception& e) {
            if (st.state == s_cleanup) {
                m->warning(st, std::string("cleanup: ") + e.what());
                st.state = s_done;
            } else {
                st.state = m->terminate(
                    st, SPDFItemReport::is_failed, std::string("internal error: ") + e.what());
            }
        }
    }
    st.password.clear();
    st.report.finished = SUtil::current_timestamp();

    auto const& r = st.report;
    switch (r.status) {
    case SPDFItemReport::is_succeeded:
        if (!m->config.getDryRun()) {
            m->logger->info("Sanitization complete. Output: " + r.item.output);
        }
        break;
    case SPDFItemReport::is_skipped:
        m->logger->warn("Skipped " + r.item.input + ": " + r.reason);
        break;
    case SPDFItemReport::is_failed:
        m->logger->error("Failed " + r.item.input + ": " + r.reason);
        break;
    default:
        throw std::logic_error("SPDFPipeline: item finished without a terminal status");
    }
    return r;
}

state_e
SPDFPipeline::Members::terminate(
    ItemState& st, SPDFItemReport::status_e status, std::string const& reason)
{
    st.report.status = status;
    st.report.reason = reason;
    return st.work_dir.empty() ? s_done : s_cleanup;
}

void
SPDFPipeline::Members::warning(ItemState& st, std::string const& msg)
{
    logger->warn(msg);
    st.report.warnings.push_back(msg);
}

std::string
SPDFPipeline::Members::outputSibling(ItemState& st, std::string const& suffix)
{
    auto const& output = st.report.item.output;
    return SUtil::path_join(SUtil::path_dirname(output), SUtil::path_stem(output) + suffix);
}

void
SPDFPipeline::Members::recordSkip(ItemState& st, spdf_stage_e stage, std::string const& detail)
{
    SPDFStageOutcome o;
    o.stage = stage;
    o.started = o.finished = SUtil::current_timestamp();
    o.status = SPDFStageResult::st_skipped;
    o.detail = detail;
    st.report.stages.push_back(o);
    logger->info(std::string("Skipping ") + SPDFStage::stageName(stage) + ": " + detail);
}

bool
SPDFPipeline::Members::runStage(
    ItemState& st,
    spdf_stage_e stage,
    std::shared_ptr<SPDFStage> impl,
    SPDFStageRequest const& req,
    SPDFStageResult& result)
{
    SPDFStageOutcome o;
    o.stage = stage;
    o.started = SUtil::current_timestamp();
    try {
        result = impl->run(req);
    } catch (std::exception& e) {
        result = SPDFStageResult::failed(e.what());
    }
    o.finished = SUtil::current_timestamp();
    o.status = result.status;
    o.detail = result.detail;
    st.report.stages.push_back(o);
    std::string name = SPDFStage::stageName(stage);
    if (result.status == SPDFStageResult::st_failed) {
        return false;
    }
    switch (result.status) {
    case SPDFStageResult::st_applied:
        logger->info("Completed " + name);
        break;
    case SPDFStageResult::st_applied_with_warning:
        logger->warn("Completed " + name + " with warnings: " + result.detail);
        break;
    default:
        logger->info("Skipped " + name + ": " + result.detail);
        break;
    }
    if (result.ok() && !result.artifact.empty()) {
        st.artifact = result.artifact;
    }
    return true;
}

void
SPDFPipeline::Members::snapshot(ItemState& st, int step)
{
    if (!config.getSaveStepFiles()) {
        return;
    }
    auto path = outputSibling(st, "_step" + std::to_string(step) + ".pdf");
    try {
        SUtil::copy_file(st.artifact.c_str(), path.c_str());
        logger->info("Saved intermediate PDF for step " + std::to_string(step) + ": " + path);
    } catch (std::exception& e) {
        warning(st, "unable to save intermediate PDF for step " + std::to_string(step) + ": " +
                    e.what());
    }
}

state_e
SPDFPipeline::Members::pending(ItemState& st)
{
    auto const& item = st.report.item;
    logger->info("Processing: " + item.input + " -> " + item.output);
    if (config.getDryRun()) {
        logger->info("[DRY RUN] Would process: " + item.input + " -> " + item.output);
        return terminate(st, SPDFItemReport::is_succeeded, "would process");
    }
    if (!SUtil::file_can_be_opened(item.input.c_str())) {
        return terminate(st, SPDFItemReport::is_failed, "unable to read input file");
    }
    auto dir = SUtil::path_join(
        config.getWorkDir(),
        "spdf-" + std::to_string(item.index) + "-" + SUtil::random_hex(8));
    try {
        SUtil::make_directories(config.getWorkDir());
        SUtil::os_wrapper("create directory " + dir, mkdir(dir.c_str(), 0700));
    } catch (std::exception& e) {
        return terminate(
            st,
            SPDFItemReport::is_failed,
            std::string("unable to create working directory: ") + e.what());
    }
    st.work_dir = dir;
    return s_encryption_check;
}

state_e
SPDFPipeline::Members::encryptionCheck(ItemState& st)
{
    auto const& input = st.report.item.input;
    std::string detail;
    auto probe = stages.probe->probe(input, detail);
    if (probe == SPDFEncryptionProbe::pr_error) {
        return terminate(st, SPDFItemReport::is_failed, "encryption check failed: " + detail);
    }
    if (probe == SPDFEncryptionProbe::pr_not_encrypted) {
        logger->info("PDF is not encrypted: " + input);
        st.artifact = SUtil::path_join(st.work_dir, "working.pdf");
        SUtil::copy_file(input.c_str(), st.artifact.c_str());
        recordSkip(st, spdf_stage_unlock, "not encrypted");
        return s_sanitize;
    }

    logger->info("PDF is locked/encrypted: " + input);
    int timeout = config.getPasswordTimeout();
    logger->info("Prompting for password (timeout: " + std::to_string(timeout) + " seconds)");
    std::string password;
    auto response = passwords->requestPassword("Password for " + input + ": ", timeout, password);
    if (response == SPDFPasswordSource::pw_timed_out) {
        logger->warn(
            "No password entered for " + input + " after " + std::to_string(timeout) +
            " seconds");
        return terminate(st, SPDFItemReport::is_skipped, "password timeout");
    }
    if (response == SPDFPasswordSource::pw_unavailable) {
        return terminate(st, SPDFItemReport::is_skipped, "no password available");
    }

    SPDFStageRequest req;
    req.input = input;
    req.output = SUtil::path_join(st.work_dir, "unlocked.pdf");
    req.password = password;
    req.scratch_dir = st.work_dir;
    SPDFStageResult result;
    if (!runStage(st, spdf_stage_unlock, stages.unlock, req, result)) {
        logger->warn("Failed to unlock PDF: " + input + ": " + result.detail);
        return terminate(st, SPDFItemReport::is_skipped, "decryption failed");
    }
    logger->info("Successfully unlocked PDF: " + input);
    st.password = password;
    st.have_password = true;
    return s_sanitize;
}

state_e
SPDFPipeline::Members::sanitize(ItemState& st)
{
    if (!config.getLinearize()) {
        recordSkip(st, spdf_stage_sanitize, "LINEARIZE is not enabled");
    } else {
        logger->info("Sanitizing PDF (linearize and rewrite structure)");
        SPDFStageRequest req;
        req.input = st.artifact;
        req.output = SUtil::path_join(st.work_dir, "sanitized.pdf");
        req.scratch_dir = st.work_dir;
        SPDFStageResult result;
        if (!runStage(st, spdf_stage_sanitize, stages.sanitize, req, result)) {
            return terminate(st, SPDFItemReport::is_failed, "sanitize failed: " + result.detail);
        }
    }
    snapshot(st, 1);
    return s_attachments;
}

state_e
SPDFPipeline::Members::attachments(ItemState& st)
{
    logger->info("Removing embedded files/attachments");
    // Extract into the work directory so that only files from this
    // document are ever moved or deleted.
    SPDFStageRequest req;
    req.input = st.artifact;
    req.output = SUtil::path_join(st.work_dir, "attachments");
    req.scratch_dir = st.work_dir;
    SPDFStageResult result;
    if (!runStage(st, spdf_stage_attachments, stages.attachments, req, result)) {
        return terminate(
            st, SPDFItemReport::is_failed, "attachment strip failed: " + result.detail);
    }
    disposeAttachments(st, result.attachments);
    snapshot(st, 2);
    return s_metadata;
}

void
SPDFPipeline::Members::moveAttachments(
    ItemState& st, std::vector<std::string> const& files, std::string const& dest_dir)
{
    try {
        SUtil::make_directories(dest_dir);
    } catch (std::exception& e) {
        warning(st, "unable to create attachment directory " + dest_dir + ": " + e.what());
        return;
    }
    for (auto const& f: files) {
        try {
            auto dest = unique_path(dest_dir, SUtil::path_basename(f));
            SUtil::move_file(f.c_str(), dest.c_str());
            logger->info("Moved attachment: " + SUtil::path_basename(f) + " -> " + dest);
        } catch (std::exception& e) {
            warning(st, "unable to move attachment " + f + ": " + e.what());
        }
    }
}

void
SPDFPipeline::Members::disposeAttachments(ItemState& st, std::vector<std::string> const& files)
{
    if (files.empty()) {
        logger->info("No attachments found");
        return;
    }
    logger->info("Extracted " + std::to_string(files.size()) + " attachment(s)");
    auto const& dest_dir = config.getAttachmentDir();
    if (!dest_dir.empty()) {
        moveAttachments(st, files, dest_dir);
    } else if (config.getDeleteAttachments()) {
        for (auto const& f: files) {
            try {
                SUtil::remove_file(f.c_str());
                logger->info("Deleted attachment: " + SUtil::path_basename(f));
            } catch (std::exception& e) {
                warning(st, "unable to delete attachment " + f + ": " + e.what());
            }
        }
    } else {
        auto keep_dir = outputSibling(st, "_attachments");
        moveAttachments(st, files, keep_dir);
        logger->info("Attachments left in " + keep_dir);
    }
}

state_e
SPDFPipeline::Members::metadata(ItemState& st)
{
    logger->info("Stripping all metadata");
    SPDFStageRequest req;
    req.input = st.artifact;
    req.output = st.artifact;
    req.scratch_dir = st.work_dir;
    SPDFStageResult result;
    if (!runStage(st, spdf_stage_metadata, stages.metadata, req, result)) {
        return terminate(
            st, SPDFItemReport::is_failed, "metadata strip failed: " + result.detail);
    }
    auto backup = st.artifact + "_original";
    if (SUtil::file_exists(backup)) {
        try {
            SUtil::remove_file(backup.c_str());
        } catch (std::exception& e) {
            warning(st, std::string("unable to remove metadata backup: ") + e.what());
        }
    }
    snapshot(st, 3);
    return s_rewrite;
}

state_e
SPDFPipeline::Members::rewrite(ItemState& st)
{
    logger->info("Reprocessing and further cleaning with Ghostscript");
    auto const& output = st.report.item.output;
    // Ghostscript writes into the work directory, and the result
    // replaces the output only when it succeeds.
    SPDFStageRequest req;
    req.input = st.artifact;
    req.output = SUtil::path_join(st.work_dir, "rewritten.pdf");
    req.scratch_dir = st.work_dir;
    SPDFStageResult result;
    if (!runStage(st, spdf_stage_rewrite, stages.rewrite, req, result)) {
        return terminate(st, SPDFItemReport::is_failed, "rewrite failed: " + result.detail);
    }
    if (!SUtil::file_exists(req.output)) {
        return terminate(st, SPDFItemReport::is_failed, "rewrite failed: no output was written");
    }
    try {
        SUtil::move_file(req.output.c_str(), output.c_str());
    } catch (std::exception& e) {
        return terminate(
            st, SPDFItemReport::is_failed, std::string("unable to write output: ") + e.what());
    }
    st.artifact = output;
    return s_relock;
}

state_e
SPDFPipeline::Members::relock(ItemState& st)
{
    auto const& output = st.report.item.output;
    if (!config.getRelock()) {
        recordSkip(st, spdf_stage_relock, "RELOCK_CLEANED is not enabled");
    } else if (!st.have_password) {
        recordSkip(st, spdf_stage_relock, "input was not encrypted");
    } else {
        logger->info("Relocking sanitized PDF with original password");
        SPDFStageRequest req;
        req.input = output;
        req.output = SUtil::path_join(st.work_dir, "relocked.pdf");
        req.password = st.password;
        req.scratch_dir = st.work_dir;
        SPDFStageResult result;
        bool ok = runStage(st, spdf_stage_relock, stages.relock, req, result);
        if (ok) {
            try {
                SUtil::move_file(result.artifact.c_str(), output.c_str());
                st.report.relocked = true;
                logger->info("PDF relocked: " + output);
            } catch (std::exception& e) {
                result.detail = e.what();
                ok = false;
            }
        }
        if (!ok) {
            warning(st, "Failed to relock PDF: " + output + ": " + result.detail);
        }
    }

    try {
        Pl_SHA2 sha;
        SUtil::pipe_file(output.c_str(), &sha);
        st.report.digest = sha.getHexDigest();
        logger->info("SHA-256 " + output + ": " + st.report.digest);
    } catch (std::exception& e) {
        warning(st, std::string("unable to compute digest of output: ") + e.what());
    }
    return terminate(st, SPDFItemReport::is_succeeded, "");
}

state_e
SPDFPipeline::Members::cleanup(ItemState& st)
{
    logger->info("Cleaning up temporary files");
    try {
        SUtil::remove_tree(st.work_dir);
    } catch (std::exception& e) {
        warning(st, std::string("cleanup: ") + e.what());
    }
    st.work_dir.clear();
    return s_done;
}
