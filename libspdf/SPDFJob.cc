#include <spdf/SPDFJob.hh>

#include <spdf/SPDFConfigFile.hh>
#include <spdf/SPDFExc.hh>
#include <spdf/SPDFExternalTools.hh>
#include <spdf/SPDFFileSet.hh>
#include <spdf/SPDFPipeline.hh>

#include <stdexcept>

class SPDFJob::Members
{
  public:
    Members() :
        logger(SPDFLogger::defaultLogger()),
        config_file("spdf.conf"),
        report(std::make_shared<SPDFRunReport>())
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    std::shared_ptr<SPDFLogger> logger;
    std::shared_ptr<SPDFPasswordSource> passwords;
    bool have_stages{false};
    SPDFStageSet stages;
    std::string config_file;
    std::vector<std::string> positionals;
    SPDFRunConfig config;
    std::shared_ptr<SPDFRunReport> report;
    int exit_code{spdf_exit_success};
};

SPDFJob::SPDFJob() :
    m(new Members())
{
}

void
SPDFJob::setConfigFile(std::string const& path)
{
    m->config_file = path;
}

void
SPDFJob::addPositional(std::string const& arg)
{
    m->positionals.push_back(arg);
}

void
SPDFJob::setLogger(std::shared_ptr<SPDFLogger> l)
{
    if (l == nullptr) {
        l = SPDFLogger::defaultLogger();
    }
    m->logger = l;
}

std::shared_ptr<SPDFLogger>
SPDFJob::getLogger()
{
    return m->logger;
}

void
SPDFJob::setPasswordSource(std::shared_ptr<SPDFPasswordSource> p)
{
    m->passwords = p;
}

void
SPDFJob::setStageSet(SPDFStageSet const& stages)
{
    m->stages = stages;
    m->have_stages = true;
}

SPDFRunConfig
SPDFJob::getConfig() const
{
    return m->config;
}

std::shared_ptr<SPDFRunReport>
SPDFJob::getReport() const
{
    return m->report;
}

int
SPDFJob::getExitCode() const
{
    return m->exit_code;
}

void
SPDFJob::run()
{
    auto& logger = m->logger;
    // Messages from reading the configuration belong in the log file it
    // names.
    logger->holdForLogFile();
    try {
        m->config = SPDFConfigFile::resolve(m->config_file, m->positionals, logger);
    } catch (std::exception&) {
        logger->holdForLogFile(false);
        throw;
    }
    auto const& config = m->config;

    if (config.getLogFile().empty()) {
        logger->holdForLogFile(false);
    } else {
        try {
            logger->setLogFile(config.getLogFile());
        } catch (std::runtime_error& e) {
            throw SPDFExc(
                spdf_e_bootstrap,
                config.getLogFile(),
                std::string("unable to open log file: ") + e.what());
        }
    }
    if (config.getDryRun()) {
        logger->info("Dry run: no files will be changed");
    }

    auto items = SPDFFileSet::resolve(config);
    if (config.hasExplicitPair()) {
        logger->info("Single-file mode: " + config.getExplicitInput());
    } else {
        logger->info(
            "Found " + std::to_string(items.size()) + " file(s) matching " +
            config.getFilePattern() + " in " + config.getInputDir());
    }
    for (auto const& dup: SPDFFileSet::duplicateOutputs(items)) {
        logger->warn("more than one input file would be written to " + dup);
    }

    if (!m->passwords) {
        m->passwords = std::make_shared<SPDFTerminalPasswordSource>();
    }
    SPDFPipeline pipeline(
        config,
        m->have_stages ? m->stages : SPDFExternalTools::create(config),
        m->passwords,
        logger);
    for (auto const& item: items) {
        m->report->add(pipeline.process(item));
    }
    m->report->writeSummary(*logger);
    m->exit_code = m->report->hasFailures() ? spdf_exit_item_failed : spdf_exit_success;
}
