#include <spdf/assert_test.h>

#include <spdf/Pl_SHA2.hh>
#include <spdf/Pl_String.hh>
#include <spdf/SPDFPipeline.hh>
#include <spdf/SUtil.hh>

#include <deque>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace
{
    std::string
    contents(std::string const& path)
    {
        std::string result;
        Pl_String p("contents", nullptr, result);
        SUtil::pipe_file(path.c_str(), &p);
        return result;
    }

    // Files whose names contain "locked" are encrypted, and files
    // whose names contain "corrupt" can't be checked.
    class FakeProbe: public SPDFEncryptionProbe
    {
      public:
        result_e
        probe(std::string const& path, std::string& detail) override
        {
            if (path.find("corrupt") != std::string::npos) {
                detail = "file is damaged";
                return pr_error;
            }
            return (path.find("locked") != std::string::npos) ? pr_encrypted : pr_not_encrypted;
        }
    };

    // Writes "tag(<input contents>)" to the output and records every
    // request.
    class FakeStage: public SPDFStage
    {
      public:
        FakeStage(std::string const& tag) :
            tag(tag)
        {
        }

        SPDFStageResult
        run(SPDFStageRequest const& req) override
        {
            requests.push_back(req);
            if (!fail_with.empty()) {
                if (write_partial) {
                    SUtil::write_file(req.output.c_str(), "partial");
                }
                return SPDFStageResult::failed(fail_with);
            }
            if (!throw_with.empty()) {
                throw std::runtime_error(throw_with);
            }
            if (!required_password.empty() && (req.password != required_password)) {
                return SPDFStageResult::failed("invalid password");
            }
            if (write_output) {
                SUtil::write_file(req.output.c_str(), tag + "(" + contents(req.input) + ")");
            }
            if (!warning.empty()) {
                return SPDFStageResult::appliedWithWarning(req.output, warning);
            }
            return SPDFStageResult::applied(req.output);
        }

        std::string tag;
        std::string fail_with;
        std::string throw_with;
        std::string warning;
        std::string required_password;
        bool write_partial{false};
        bool write_output{true};
        std::vector<SPDFStageRequest> requests;
    };

    // Extracts the configured attachment names into the requested
    // directory.
    class FakeDetach: public SPDFStage
    {
      public:
        SPDFStageResult
        run(SPDFStageRequest const& req) override
        {
            requests.push_back(req);
            SUtil::make_directories(req.output);
            auto r = SPDFStageResult::applied(req.input);
            for (auto const& name: names) {
                auto path = SUtil::path_join(req.output, name);
                SUtil::write_file(path.c_str(), "attachment " + name);
                r.attachments.push_back(path);
            }
            return r;
        }

        std::vector<std::string> names;
        std::vector<SPDFStageRequest> requests;
    };

    // Rewrites its input in place and leaves a backup beside it, the
    // way exiftool does.
    class FakeMetadata: public SPDFStage
    {
      public:
        SPDFStageResult
        run(SPDFStageRequest const& req) override
        {
            if (!throw_with.empty()) {
                throw std::runtime_error(throw_with);
            }
            auto original = contents(req.input);
            SUtil::write_file((req.input + "_original").c_str(), original);
            SUtil::write_file(req.input.c_str(), "meta(" + original + ")");
            return SPDFStageResult::applied(req.input);
        }

        std::string throw_with;
    };

    class ScriptedPasswords: public SPDFPasswordSource
    {
      public:
        response_e
        requestPassword(
            std::string const& prompt, int timeout_seconds, std::string& password) override
        {
            prompts.push_back(prompt);
            timeouts.push_back(timeout_seconds);
            if (responses.empty()) {
                return pw_unavailable;
            }
            auto r = responses.front();
            responses.pop_front();
            if (r.first == pw_provided) {
                password = r.second;
            }
            return r.first;
        }

        std::deque<std::pair<response_e, std::string>> responses;
        std::vector<std::string> prompts;
        std::vector<int> timeouts;
    };

    struct Fixture
    {
        Fixture(std::string const& top, std::string const& name) :
            dir(SUtil::path_join(top, name)),
            work_dir(SUtil::path_join(dir, "work")),
            logger(SPDFLogger::create()),
            passwords(std::make_shared<ScriptedPasswords>()),
            unlock(std::make_shared<FakeStage>("unlock")),
            sanitize(std::make_shared<FakeStage>("linear")),
            detach(std::make_shared<FakeDetach>()),
            metadata(std::make_shared<FakeMetadata>()),
            rewrite(std::make_shared<FakeStage>("gs")),
            relock(std::make_shared<FakeStage>("lock"))
        {
            SUtil::make_directories(dir);
            logger->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
            logger->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
            builder.workDir(work_dir);
            stages.probe = std::make_shared<FakeProbe>();
            stages.unlock = unlock;
            stages.sanitize = sanitize;
            stages.attachments = detach;
            stages.metadata = metadata;
            stages.rewrite = rewrite;
            stages.relock = relock;
        }

        SPDFWorkItem
        item(std::string const& name, std::string const& data = "doc")
        {
            SPDFWorkItem i;
            i.input = SUtil::path_join(dir, name);
            i.output = SUtil::path_join(dir, "out/sanitized_" + name);
            SUtil::make_directories(SUtil::path_join(dir, "out"));
            SUtil::write_file(i.input.c_str(), data);
            return i;
        }

        SPDFItemReport
        process(SPDFWorkItem const& i)
        {
            SPDFPipeline p(builder.build(), stages, passwords, logger);
            return p.process(i);
        }

        bool
        workDirEmpty()
        {
            return !SUtil::file_exists(work_dir) || SUtil::list_files_recursive(work_dir).empty();
        }

        std::string dir;
        std::string work_dir;
        std::shared_ptr<SPDFLogger> logger;
        std::string info;
        std::string errors;
        std::shared_ptr<ScriptedPasswords> passwords;
        std::shared_ptr<FakeStage> unlock;
        std::shared_ptr<FakeStage> sanitize;
        std::shared_ptr<FakeDetach> detach;
        std::shared_ptr<FakeMetadata> metadata;
        std::shared_ptr<FakeStage> rewrite;
        std::shared_ptr<FakeStage> relock;
        SPDFRunConfig::Builder builder;
        SPDFStageSet stages;
    };

    bool
    has(std::string const& text, std::string const& needle)
    {
        return text.find(needle) != std::string::npos;
    }
} // namespace

static void
test_plain(std::string const& top)
{
    Fixture f(top, "plain");
    auto i = f.item("a.pdf");
    auto r = f.process(i);
    assert(r.status == SPDFItemReport::is_succeeded);
    assert(r.reason.empty());
    assert(contents(i.output) == "gs(meta(doc))");
    assert(r.stages.size() == 6);
    assert(r.stages.at(0).stage == spdf_stage_unlock);
    assert(r.stages.at(0).status == SPDFStageResult::st_skipped);
    assert(r.stages.at(0).detail == "not encrypted");
    assert(r.stages.at(1).stage == spdf_stage_sanitize);
    assert(r.stages.at(1).status == SPDFStageResult::st_skipped);
    assert(r.stages.at(2).stage == spdf_stage_attachments);
    assert(r.stages.at(2).status == SPDFStageResult::st_applied);
    assert(r.stages.at(3).stage == spdf_stage_metadata);
    assert(r.stages.at(4).stage == spdf_stage_rewrite);
    assert(r.stages.at(5).stage == spdf_stage_relock);
    assert(r.stages.at(5).status == SPDFStageResult::st_skipped);
    assert(!r.relocked);
    assert(f.passwords->prompts.empty());
    assert(f.unlock->requests.empty());
    assert(f.sanitize->requests.empty());
    assert(f.relock->requests.empty());

    // The input is never modified.
    assert(contents(i.input) == "doc");

    auto step = [&f](int n) {
        return SUtil::path_join(f.dir, "out/sanitized_a_step" + std::to_string(n) + ".pdf");
    };
    assert(contents(step(1)) == "doc");
    assert(contents(step(2)) == "doc");
    assert(contents(step(3)) == "meta(doc)");

    Pl_SHA2 sha;
    SUtil::pipe_file(i.output.c_str(), &sha);
    assert(r.digest == sha.getHexDigest());

    assert(f.workDirEmpty());
    assert(has(f.info, "Processing: " + i.input + " -> " + i.output));
    assert(has(f.info, "PDF is not encrypted: " + i.input));
    assert(has(f.info, "No attachments found"));
    assert(has(f.info, "Sanitization complete. Output: " + i.output));
    assert(has(f.info, "SHA-256 " + i.output + ": " + r.digest));
    assert(f.errors.empty());
    // No empty attachment directory is left behind.
    assert(!SUtil::file_exists(SUtil::path_join(f.dir, "out/sanitized_a_attachments")));
}

static void
test_linearize_without_snapshots(std::string const& top)
{
    Fixture f(top, "linear");
    f.builder.linearize(true).saveStepFiles(false);
    f.sanitize->warning = "WARNING: recovered damaged xref";
    auto i = f.item("a.pdf");
    auto r = f.process(i);
    assert(r.status == SPDFItemReport::is_succeeded);
    assert(contents(i.output) == "gs(meta(linear(doc)))");
    assert(r.stages.at(1).status == SPDFStageResult::st_applied_with_warning);
    assert(has(f.errors, "Completed sanitize with warnings: WARNING: recovered damaged xref"));
    assert(!SUtil::file_exists(SUtil::path_join(f.dir, "out/sanitized_a_step1.pdf")));
}

static void
test_encrypted_relock(std::string const& top)
{
    Fixture f(top, "relock");
    f.builder.relock(true).passwordTimeout(7);
    f.unlock->required_password = "hunter2";
    f.passwords->responses.push_back({SPDFPasswordSource::pw_provided, "hunter2"});
    auto i = f.item("locked.pdf", "secret");
    auto r = f.process(i);
    assert(r.status == SPDFItemReport::is_succeeded);
    assert(r.relocked);
    assert(contents(i.output) == "lock(gs(meta(unlock(secret))))");
    assert(f.passwords->prompts.size() == 1);
    assert(f.passwords->prompts.at(0) == "Password for " + i.input + ": ");
    assert(f.passwords->timeouts.at(0) == 7);
    assert(f.relock->requests.size() == 1);
    assert(f.relock->requests.at(0).password == "hunter2");
    assert(f.relock->requests.at(0).input == i.output);
    // Passwords are only handed to the stages that need them.
    assert(f.rewrite->requests.at(0).password.empty());
    assert(r.stages.at(0).status == SPDFStageResult::st_applied);
    assert(r.stages.at(5).status == SPDFStageResult::st_applied);
    assert(has(f.info, "PDF is locked/encrypted: " + i.input));
    assert(has(f.info, "Prompting for password (timeout: 7 seconds)"));
    assert(has(f.info, "Successfully unlocked PDF"));
    assert(has(f.info, "PDF relocked: " + i.output));
    assert(!has(f.info, "hunter2"));
    assert(!has(f.errors, "hunter2"));
    assert(f.workDirEmpty());
}

static void
test_encrypted_without_relock(std::string const& top)
{
    Fixture f(top, "norelock");
    f.passwords->responses.push_back({SPDFPasswordSource::pw_provided, "pw"});
    auto i = f.item("locked.pdf", "secret");
    auto r = f.process(i);
    assert(r.status == SPDFItemReport::is_succeeded);
    assert(!r.relocked);
    assert(contents(i.output) == "gs(meta(unlock(secret)))");
    assert(r.stages.at(5).status == SPDFStageResult::st_skipped);
    assert(r.stages.at(5).detail == "RELOCK_CLEANED is not enabled");

    // Relocking is only possible for inputs that were unlocked.
    Fixture g(top, "relock-plain");
    g.builder.relock(true);
    auto j = g.item("a.pdf");
    auto s = g.process(j);
    assert(s.status == SPDFItemReport::is_succeeded);
    assert(s.stages.at(5).detail == "input was not encrypted");
    assert(g.relock->requests.empty());
}

static void
test_relock_failure(std::string const& top)
{
    Fixture f(top, "relock-fail");
    f.builder.relock(true);
    f.relock->fail_with = "qpdf exited with status 2: out of memory";
    f.passwords->responses.push_back({SPDFPasswordSource::pw_provided, "pw"});
    auto i = f.item("locked.pdf", "secret");
    auto r = f.process(i);
    // The sanitized output is still usable.
    assert(r.status == SPDFItemReport::is_succeeded);
    assert(!r.relocked);
    assert(contents(i.output) == "gs(meta(unlock(secret)))");
    assert(r.warnings.size() == 1);
    assert(has(r.warnings.at(0), "Failed to relock PDF: " + i.output));
    assert(r.stages.at(5).status == SPDFStageResult::st_failed);
}

static void
test_password_problems(std::string const& top)
{
    Fixture f(top, "passwords");
    f.unlock->required_password = "right";
    f.passwords->responses.push_back({SPDFPasswordSource::pw_timed_out, ""});
    f.passwords->responses.push_back({SPDFPasswordSource::pw_provided, "wrong"});
    // Then no more answers

    auto i = f.item("locked1.pdf");
    auto r = f.process(i);
    assert(r.status == SPDFItemReport::is_skipped);
    assert(r.reason == "password timeout");
    assert(!SUtil::file_exists(i.output));

    auto j = f.item("locked2.pdf");
    r = f.process(j);
    assert(r.status == SPDFItemReport::is_skipped);
    assert(r.reason == "decryption failed");
    assert(!SUtil::file_exists(j.output));
    assert(has(f.errors, "Failed to unlock PDF: " + j.input + ": invalid password"));

    auto k = f.item("locked3.pdf");
    r = f.process(k);
    assert(r.status == SPDFItemReport::is_skipped);
    assert(r.reason == "no password available");

    assert(has(f.errors, "WARNING: Skipped " + i.input + ": password timeout"));
    assert(f.workDirEmpty());
    assert(f.rewrite->requests.empty());
}

static void
test_failures(std::string const& top)
{
    {
        Fixture f(top, "missing");
        SPDFWorkItem i;
        i.input = SUtil::path_join(f.dir, "nothere.pdf");
        i.output = SUtil::path_join(f.dir, "out.pdf");
        auto r = f.process(i);
        assert(r.status == SPDFItemReport::is_failed);
        assert(r.reason == "unable to read input file");
        assert(has(f.errors, "ERROR: Failed " + i.input + ": unable to read input file"));
        assert(!SUtil::file_exists(f.work_dir));
    }
    {
        Fixture f(top, "probe");
        auto r = f.process(f.item("corrupt.pdf"));
        assert(r.status == SPDFItemReport::is_failed);
        assert(r.reason == "encryption check failed: file is damaged");
        assert(f.workDirEmpty());
    }
    {
        Fixture f(top, "rewrite");
        f.rewrite->fail_with = "gs exited with status 1: Unrecoverable error";
        f.rewrite->write_partial = true;
        auto i = f.item("a.pdf");
        auto r = f.process(i);
        assert(r.status == SPDFItemReport::is_failed);
        assert(r.reason == "rewrite failed: gs exited with status 1: Unrecoverable error");
        assert(!SUtil::file_exists(i.output));
        assert(r.stages.back().stage == spdf_stage_rewrite);
        assert(r.stages.back().status == SPDFStageResult::st_failed);
        assert(f.workDirEmpty());
    }
    {
        // A failed rewrite leaves an earlier output alone.
        Fixture f(top, "rewrite-earlier");
        f.rewrite->fail_with = "gs exited with status 1: Unrecoverable error";
        f.rewrite->write_partial = true;
        auto i = f.item("a.pdf");
        SUtil::write_file(i.output.c_str(), "earlier output");
        auto r = f.process(i);
        assert(r.status == SPDFItemReport::is_failed);
        assert(contents(i.output) == "earlier output");
        assert(f.rewrite->requests.at(0).output != i.output);
        assert(f.workDirEmpty());
    }
    {
        Fixture f(top, "rewrite-silent");
        f.rewrite->write_output = false;
        auto r = f.process(f.item("a.pdf"));
        assert(r.status == SPDFItemReport::is_failed);
        assert(r.reason == "rewrite failed: no output was written");
    }
    {
        Fixture f(top, "metadata");
        f.metadata->throw_with = "boom";
        auto i = f.item("a.pdf");
        auto r = f.process(i);
        assert(r.status == SPDFItemReport::is_failed);
        assert(r.reason == "metadata strip failed: boom");
        assert(f.rewrite->requests.empty());
        assert(f.workDirEmpty());
    }
}

static void
test_attachments(std::string const& top)
{
    {
        // Moved to ATTACHMENT_DIR without overwriting
        Fixture f(top, "attach-move");
        auto dest = SUtil::path_join(f.dir, "attachments");
        SUtil::make_directories(dest);
        SUtil::write_file(SUtil::path_join(dest, "invoice.xls").c_str(), "older");
        f.builder.attachmentDir(dest);
        f.detach->names = {"invoice.xls", "notes.txt"};
        auto i = f.item("a.pdf");
        auto r = f.process(i);
        assert(r.status == SPDFItemReport::is_succeeded);
        assert(contents(SUtil::path_join(dest, "invoice.xls")) == "older");
        assert(contents(SUtil::path_join(dest, "invoice-1.xls")) == "attachment invoice.xls");
        assert(contents(SUtil::path_join(dest, "notes.txt")) == "attachment notes.txt");
        assert(!SUtil::file_exists(SUtil::path_join(f.dir, "out/sanitized_a_attachments")));
        assert(has(f.info, "Extracted 2 attachment(s)"));
    }
    {
        Fixture f(top, "attach-delete");
        f.builder.deleteAttachments(true);
        f.detach->names = {"x.bin"};
        auto r = f.process(f.item("a.pdf"));
        assert(r.status == SPDFItemReport::is_succeeded);
        assert(!SUtil::file_exists(SUtil::path_join(f.dir, "out/sanitized_a_attachments")));
        assert(has(f.info, "Deleted attachment: "));
    }
    {
        Fixture f(top, "attach-keep");
        f.detach->names = {"x.bin"};
        auto r = f.process(f.item("a.pdf"));
        assert(r.status == SPDFItemReport::is_succeeded);
        auto kept = SUtil::path_join(f.dir, "out/sanitized_a_attachments/x.bin");
        assert(contents(kept) == "attachment x.bin");
        assert(f.detach->requests.at(0).output != SUtil::path_dirname(kept));

        // A second run keeps what the first one left.
        r = f.process(f.item("a.pdf"));
        assert(r.status == SPDFItemReport::is_succeeded);
        assert(contents(kept) == "attachment x.bin");
        assert(
            contents(SUtil::path_join(f.dir, "out/sanitized_a_attachments/x-1.bin")) ==
            "attachment x.bin");
        assert(f.workDirEmpty());
    }
    {
        // Files left from an earlier run are not this document's
        // attachments.
        Fixture f(top, "attach-earlier");
        f.builder.deleteAttachments(true);
        auto earlier_dir = SUtil::path_join(f.dir, "out/sanitized_a_attachments");
        SUtil::make_directories(earlier_dir);
        auto earlier = SUtil::path_join(earlier_dir, "earlier.txt");
        SUtil::write_file(earlier.c_str(), "keep me");
        auto r = f.process(f.item("a.pdf"));
        assert(r.status == SPDFItemReport::is_succeeded);
        assert(contents(earlier) == "keep me");
        assert(has(f.info, "No attachments found"));
        assert(!has(f.info, "Deleted attachment"));

        f.builder.deleteAttachments(false).attachmentDir(SUtil::path_join(f.dir, "moved"));
        f.detach->names = {"new.txt"};
        r = f.process(f.item("a.pdf"));
        assert(r.status == SPDFItemReport::is_succeeded);
        assert(contents(earlier) == "keep me");
        assert(SUtil::list_files(SUtil::path_join(f.dir, "moved")).size() == 1);
        assert(contents(SUtil::path_join(f.dir, "moved/new.txt")) == "attachment new.txt");
    }
}

static void
test_metadata_backup_removed(std::string const& top)
{
    Fixture f(top, "backup");
    auto r = f.process(f.item("a.pdf"));
    assert(r.status == SPDFItemReport::is_succeeded);
    // The work directory, including exiftool's backup, is gone.
    assert(f.workDirEmpty());
    assert(!has(f.errors, "metadata backup"));
}

static void
test_dry_run(std::string const& top)
{
    Fixture f(top, "dry");
    f.builder.dryRun(true);
    auto i = f.item("locked.pdf");
    auto r = f.process(i);
    assert(r.status == SPDFItemReport::is_succeeded);
    assert(r.reason == "would process");
    assert(r.stages.empty());
    assert(f.passwords->prompts.empty());
    assert(!SUtil::file_exists(i.output));
    assert(!SUtil::file_exists(f.work_dir));
    assert(has(f.info, "[DRY RUN] Would process: " + i.input + " -> " + i.output));
    assert(!has(f.info, "Sanitization complete"));
}

static void
test_construction(std::string const& top)
{
    Fixture f(top, "construct");
    auto stages = f.stages;
    stages.rewrite = nullptr;
    try {
        SPDFPipeline p(f.builder.build(), stages, f.passwords, f.logger);
        assert(false);
    } catch (std::logic_error&) {
        // expected
    }
    try {
        SPDFPipeline p(f.builder.build(), f.stages, nullptr, f.logger);
        assert(false);
    } catch (std::logic_error&) {
        // expected
    }
}

int
main()
{
    std::string templ = SUtil::path_join(SUtil::temp_directory(), "spdf-pipeline-XXXXXX");
    assert(mkdtemp(templ.data()) != nullptr);
    test_plain(templ);
    test_linearize_without_snapshots(templ);
    test_encrypted_relock(templ);
    test_encrypted_without_relock(templ);
    test_relock_failure(templ);
    test_password_problems(templ);
    test_failures(templ);
    test_attachments(templ);
    test_metadata_backup_removed(templ);
    test_dry_run(templ);
    test_construction(templ);
    SUtil::remove_tree(templ);
    std::cout << "pipeline tests passed" << std::endl;
    return 0;
}
