#include <spdf/SPDFExternalTools.hh>

#include <spdf/Pl_String.hh>
#include <spdf/SPDFProcess.hh>
#include <spdf/SUtil.hh>

#include <cctype>
#include <stdexcept>

namespace
{
    std::string
    last_line(std::string const& text)
    {
        std::string result;
        size_t start = 0;
        while (start < text.length()) {
            auto nl = text.find('\n', start);
            if (nl == std::string::npos) {
                nl = text.length();
            }
            auto line = SUtil::trim(text.substr(start, nl - start));
            if (!line.empty()) {
                result = line;
            }
            start = nl + 1;
        }
        return result;
    }

    std::string
    first_warning(std::string const& text)
    {
        size_t start = 0;
        while (start < text.length()) {
            auto nl = text.find('\n', start);
            if (nl == std::string::npos) {
                nl = text.length();
            }
            auto line = text.substr(start, nl - start);
            // Ghostscript indents its warnings and decorates them with
            // asterisks.
            auto p = line.find_first_not_of(" \t*");
            if ((p != std::string::npos) && (line.compare(p, 7, "Warning") == 0)) {
                return SUtil::trim(line.substr(p));
            }
            start = nl + 1;
        }
        return "";
    }

    class ToolStage: public SPDFStage
    {
      public:
        ToolStage(std::string const& program, bool is_qpdf) :
            program(program),
            is_qpdf(is_qpdf)
        {
        }

        SPDFStageResult
        run(SPDFStageRequest const& req) override
        {
            try {
                return runTool(req);
            } catch (std::exception& e) {
                return SPDFStageResult::failed(program + ": " + e.what());
            }
        }

      protected:
        virtual SPDFStageResult runTool(SPDFStageRequest const&) = 0;

        SPDFStageResult
        execute(
            std::vector<std::string> const& args,
            std::string const& input,
            std::string const& artifact)
        {
            std::vector<std::string> argv{program};
            argv.insert(argv.end(), args.begin(), args.end());
            std::string out;
            std::string err;
            Pl_String p_out("tool output", nullptr, out);
            Pl_String p_err("tool error", nullptr, err);
            SPDFProcess proc(argv);
            proc.setInput(input);
            proc.setOutput(&p_out);
            proc.setError(&p_err);
            int status = proc.run();
            return SPDFExternalTools::interpretExit(program, is_qpdf, status, out, err, artifact);
        }

        // Demote a result to failure if the file it claims to have
        // written isn't there.
        SPDFStageResult
        requireOutput(SPDFStageResult r)
        {
            if (r.ok() && !SUtil::file_exists(r.artifact)) {
                return SPDFStageResult::failed(program + " did not create " + r.artifact);
            }
            return r;
        }

        std::string program;
        bool is_qpdf;
    };

    class UnlockStage: public ToolStage
    {
      public:
        UnlockStage(std::string const& qpdf) :
            ToolStage(qpdf, true)
        {
        }

      protected:
        SPDFStageResult
        runTool(SPDFStageRequest const& req) override
        {
            auto r = requireOutput(execute(
                {"--password-file=-", "--decrypt", req.input, req.output},
                req.password + "\n",
                req.output));
            if (r.status == SPDFStageResult::st_failed) {
                r.detail = "decryption failed: " + r.detail;
            }
            return r;
        }
    };

    class LinearizeStage: public ToolStage
    {
      public:
        LinearizeStage(std::string const& qpdf) :
            ToolStage(qpdf, true)
        {
        }

      protected:
        SPDFStageResult
        runTool(SPDFStageRequest const& req) override
        {
            return requireOutput(execute({"--linearize", req.input, req.output}, "", req.output));
        }
    };

    class DetachStage: public ToolStage
    {
      public:
        DetachStage(std::string const& pdfdetach) :
            ToolStage(pdfdetach, false)
        {
        }

      protected:
        SPDFStageResult
        runTool(SPDFStageRequest const& req) override
        {
            SUtil::make_directories(req.output);
            auto r = execute({"-saveall", "-o", req.output, req.input}, "", req.input);
            if (r.ok()) {
                r.attachments = SUtil::list_files(req.output);
            }
            return r;
        }
    };

    class MetadataStage: public ToolStage
    {
      public:
        MetadataStage(std::string const& exiftool, std::vector<std::string> const& args) :
            ToolStage(exiftool, false),
            args(args)
        {
        }

      protected:
        SPDFStageResult
        runTool(SPDFStageRequest const& req) override
        {
            std::vector<std::string> argv = args;
            argv.push_back(req.input);
            return requireOutput(execute(argv, "", req.input));
        }

      private:
        std::vector<std::string> args;
    };

    class RewriteStage: public ToolStage
    {
      public:
        RewriteStage(std::string const& gs, spdf_quality_e quality) :
            ToolStage(gs, false),
            quality(quality)
        {
        }

      protected:
        SPDFStageResult
        runTool(SPDFStageRequest const& req) override
        {
            return requireOutput(execute(
                {"-q",
                 "-dSAFER",
                 "-dBATCH",
                 "-dNOPAUSE",
                 "-sDEVICE=pdfwrite",
                 std::string("-dPDFSETTINGS=/") + SPDFRunConfig::qualityName(quality),
                 "-sOutputFile=" + req.output,
                 req.input},
                "",
                req.output));
        }

      private:
        spdf_quality_e quality;
    };

    class RelockStage: public ToolStage
    {
      public:
        RelockStage(std::string const& qpdf, spdf_encryption_strength_e bits) :
            ToolStage(qpdf, true),
            bits(bits)
        {
        }

      protected:
        SPDFStageResult
        runTool(SPDFStageRequest const& req) override
        {
            // With @-, qpdf reads the arguments, one per line, from
            // standard input. The passwords are given as option values
            // since qpdf would take a positional password starting with
            // '-' for an option.
            std::string args = req.input + "\n";
            if (bits == spdf_bits_40) {
                args += "--allow-weak-crypto\n";
            }
            args += "--encrypt\n--user-password=" + req.password + "\n--owner-password=" +
                req.password + "\n--bits=" + std::to_string(static_cast<int>(bits)) + "\n";
            if (bits == spdf_bits_128) {
                args += "--use-aes=y\n";
            }
            args += "--\n" + req.output + "\n";
            return requireOutput(execute({"@-"}, args, req.output));
        }

      private:
        spdf_encryption_strength_e bits;
    };

    class QpdfProbe: public SPDFEncryptionProbe
    {
      public:
        QpdfProbe(std::string const& qpdf) :
            qpdf(qpdf)
        {
        }

        result_e
        probe(std::string const& path, std::string& detail) override
        {
            try {
                std::string err;
                Pl_String p_err("probe error", nullptr, err);
                SPDFProcess proc({qpdf, "--is-encrypted", path});
                proc.setError(&p_err);
                int status = proc.run();
                if (status == 0) {
                    return pr_encrypted;
                }
                if (status == 2) {
                    return pr_not_encrypted;
                }
                detail = qpdf + " --is-encrypted exited with status " + std::to_string(status);
                auto last = last_line(err);
                if (!last.empty()) {
                    detail += ": " + last;
                }
            } catch (std::exception& e) {
                detail = qpdf + ": " + e.what();
            }
            return pr_error;
        }

      private:
        std::string qpdf;
    };
} // namespace

SPDFStageResult
SPDFExternalTools::interpretExit(
    std::string const& tool,
    bool is_qpdf,
    int status,
    std::string const& out,
    std::string const& err,
    std::string const& artifact)
{
    if (status == 0) {
        auto warning = first_warning(out);
        if (warning.empty()) {
            warning = first_warning(err);
        }
        if (!warning.empty()) {
            return SPDFStageResult::appliedWithWarning(artifact, warning);
        }
        return SPDFStageResult::applied(artifact);
    }
    auto last = last_line(err);
    if (is_qpdf && (status == 3)) {
        return SPDFStageResult::appliedWithWarning(
            artifact, last.empty() ? tool + " reported warnings" : last);
    }
    std::string cause = tool + " exited with status " + std::to_string(status);
    if (!last.empty()) {
        cause += ": " + last;
    }
    return SPDFStageResult::failed(cause);
}

SPDFStageSet
SPDFExternalTools::create(SPDFRunConfig const& config)
{
    SPDFStageSet s;
    s.probe = std::make_shared<QpdfProbe>(config.getQpdfProgram());
    s.unlock = std::make_shared<UnlockStage>(config.getQpdfProgram());
    s.sanitize = std::make_shared<LinearizeStage>(config.getQpdfProgram());
    s.attachments = std::make_shared<DetachStage>(config.getPdfdetachProgram());
    s.metadata = std::make_shared<MetadataStage>(
        config.getExiftoolProgram(), config.getExiftoolArgs());
    s.rewrite = std::make_shared<RewriteStage>(
        config.getGhostscriptProgram(), config.getQuality());
    s.relock = std::make_shared<RelockStage>(
        config.getQpdfProgram(), config.getEncryptionStrength());
    return s;
}
