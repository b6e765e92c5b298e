#include <spdf/SPDFRunConfig.hh>

#include <spdf/SUtil.hh>

#include <stdexcept>

class SPDFRunConfig::Members
{
  public:
    Members() :
        work_dir(SUtil::temp_directory())
    {
    }

    std::string input_dir{"./input"};
    std::string output_dir{"./output"};
    std::string attachment_dir;
    bool relock{false};
    std::string log_file{"spdf.log"};
    std::string file_pattern{"*.pdf"};
    int password_timeout{120};
    bool dry_run{false};
    std::string output_prefix{"sanitized_"};
    bool mirror_dir_structure{false};
    spdf_encryption_strength_e encryption_strength{spdf_bits_256};
    std::vector<std::string> exiftool_args{"-all="};
    bool delete_attachments{false};
    spdf_quality_e quality{spdf_quality_prepress};
    bool cli_override{false};
    bool linearize{false};
    bool save_step_files{true};
    std::string work_dir;
    std::string qpdf{"qpdf"};
    std::string pdfdetach{"pdfdetach"};
    std::string exiftool{"exiftool"};
    std::string ghostscript{"gs"};
    bool explicit_pair{false};
    std::string explicit_input;
    std::string explicit_output;
};

SPDFRunConfig::Builder::Builder() :
    m(std::make_shared<Members>())
{
}

SPDFRunConfig::Builder::Builder(SPDFRunConfig const& config) :
    m(std::make_shared<Members>(*config.m))
{
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::inputDir(std::string const& v)
{
    m->input_dir = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::outputDir(std::string const& v)
{
    m->output_dir = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::attachmentDir(std::string const& v)
{
    m->attachment_dir = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::relock(bool v)
{
    m->relock = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::logFile(std::string const& v)
{
    m->log_file = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::filePattern(std::string const& v)
{
    m->file_pattern = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::passwordTimeout(int seconds)
{
    if (seconds <= 0) {
        throw std::logic_error("SPDFRunConfig: password timeout must be positive");
    }
    m->password_timeout = seconds;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::dryRun(bool v)
{
    m->dry_run = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::outputPrefix(std::string const& v)
{
    m->output_prefix = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::mirrorDirStructure(bool v)
{
    m->mirror_dir_structure = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::encryptionStrength(spdf_encryption_strength_e v)
{
    m->encryption_strength = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::exiftoolArgs(std::vector<std::string> const& v)
{
    m->exiftool_args = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::deleteAttachments(bool v)
{
    m->delete_attachments = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::quality(spdf_quality_e v)
{
    m->quality = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::cliOverride(bool v)
{
    m->cli_override = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::linearize(bool v)
{
    m->linearize = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::saveStepFiles(bool v)
{
    m->save_step_files = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::workDir(std::string const& v)
{
    m->work_dir = v.empty() ? SUtil::temp_directory() : v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::qpdfProgram(std::string const& v)
{
    m->qpdf = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::pdfdetachProgram(std::string const& v)
{
    m->pdfdetach = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::exiftoolProgram(std::string const& v)
{
    m->exiftool = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::ghostscriptProgram(std::string const& v)
{
    m->ghostscript = v;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::explicitPair(std::string const& input, std::string const& output)
{
    m->explicit_pair = true;
    m->explicit_input = input;
    m->explicit_output = output;
    return *this;
}

SPDFRunConfig::Builder&
SPDFRunConfig::Builder::clearExplicitPair()
{
    m->explicit_pair = false;
    m->explicit_input.clear();
    m->explicit_output.clear();
    return *this;
}

SPDFRunConfig
SPDFRunConfig::Builder::build() const
{
    // Copy so that further use of the builder can't affect the result.
    return SPDFRunConfig(std::make_shared<Members const>(*m));
}

SPDFRunConfig::SPDFRunConfig() :
    m(std::make_shared<Members const>())
{
}

SPDFRunConfig::SPDFRunConfig(std::shared_ptr<Members const> m) :
    m(std::move(m))
{
}

std::string const&
SPDFRunConfig::getInputDir() const
{
    return m->input_dir;
}

std::string const&
SPDFRunConfig::getOutputDir() const
{
    return m->output_dir;
}

std::string const&
SPDFRunConfig::getAttachmentDir() const
{
    return m->attachment_dir;
}

bool
SPDFRunConfig::getRelock() const
{
    return m->relock;
}

std::string const&
SPDFRunConfig::getLogFile() const
{
    return m->log_file;
}

std::string const&
SPDFRunConfig::getFilePattern() const
{
    return m->file_pattern;
}

int
SPDFRunConfig::getPasswordTimeout() const
{
    return m->password_timeout;
}

bool
SPDFRunConfig::getDryRun() const
{
    return m->dry_run;
}

std::string const&
SPDFRunConfig::getOutputPrefix() const
{
    return m->output_prefix;
}

bool
SPDFRunConfig::getMirrorDirStructure() const
{
    return m->mirror_dir_structure;
}

spdf_encryption_strength_e
SPDFRunConfig::getEncryptionStrength() const
{
    return m->encryption_strength;
}

std::vector<std::string> const&
SPDFRunConfig::getExiftoolArgs() const
{
    return m->exiftool_args;
}

bool
SPDFRunConfig::getDeleteAttachments() const
{
    return m->delete_attachments;
}

spdf_quality_e
SPDFRunConfig::getQuality() const
{
    return m->quality;
}

bool
SPDFRunConfig::getCliOverride() const
{
    return m->cli_override;
}

bool
SPDFRunConfig::getLinearize() const
{
    return m->linearize;
}

bool
SPDFRunConfig::getSaveStepFiles() const
{
    return m->save_step_files;
}

std::string const&
SPDFRunConfig::getWorkDir() const
{
    return m->work_dir;
}

std::string const&
SPDFRunConfig::getQpdfProgram() const
{
    return m->qpdf;
}

std::string const&
SPDFRunConfig::getPdfdetachProgram() const
{
    return m->pdfdetach;
}

std::string const&
SPDFRunConfig::getExiftoolProgram() const
{
    return m->exiftool;
}

std::string const&
SPDFRunConfig::getGhostscriptProgram() const
{
    return m->ghostscript;
}

bool
SPDFRunConfig::hasExplicitPair() const
{
    return m->explicit_pair;
}

std::string const&
SPDFRunConfig::getExplicitInput() const
{
    return m->explicit_input;
}

std::string const&
SPDFRunConfig::getExplicitOutput() const
{
    return m->explicit_output;
}

char const*
SPDFRunConfig::qualityName(spdf_quality_e q)
{
    switch (q) {
    case spdf_quality_screen:
        return "screen";
    case spdf_quality_ebook:
        return "ebook";
    case spdf_quality_printer:
        return "printer";
    case spdf_quality_prepress:
        return "prepress";
    }
    throw std::logic_error("SPDFRunConfig: invalid quality tier");
}
