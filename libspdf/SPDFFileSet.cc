#include <spdf/SPDFFileSet.hh>

#include <spdf/SPDFExc.hh>
#include <spdf/SUtil.hh>

#include <map>
#include <stdexcept>

std::vector<SPDFWorkItem>
SPDFFileSet::resolve(SPDFRunConfig const& config)
{
    std::vector<SPDFWorkItem> result;
    if (config.hasExplicitPair()) {
        SPDFWorkItem item;
        item.input = config.getExplicitInput();
        item.output = config.getExplicitOutput();
        auto dir = SUtil::path_dirname(item.output);
        if (!(config.getDryRun() || dir.empty())) {
            SUtil::make_directories(dir);
        }
        result.push_back(item);
        return result;
    }

    auto const& input_dir = config.getInputDir();
    if (!SUtil::is_directory(input_dir)) {
        throw SPDFExc(spdf_e_discovery, input_dir, "input directory does not exist");
    }
    std::vector<std::string> files;
    try {
        files = SUtil::list_files_recursive(input_dir);
    } catch (std::runtime_error& e) {
        throw SPDFExc(spdf_e_discovery, input_dir, e.what());
    }

    for (auto const& relative: files) {
        auto base = SUtil::path_basename(relative);
        if (!SUtil::glob_match(config.getFilePattern(), base)) {
            continue;
        }
        SPDFWorkItem item;
        item.index = result.size();
        item.input = SUtil::path_join(input_dir, relative);
        item.relative_dir = SUtil::path_dirname(relative);
        auto out_dir = config.getOutputDir();
        if (config.getMirrorDirStructure()) {
            out_dir = SUtil::path_join(out_dir, item.relative_dir);
        }
        item.output = SUtil::path_join(out_dir, config.getOutputPrefix() + base);
        if (!config.getDryRun()) {
            SUtil::make_directories(out_dir);
        }
        result.push_back(item);
    }
    if (result.empty()) {
        throw SPDFExc(
            spdf_e_discovery,
            input_dir,
            "no files matching " + config.getFilePattern() + " found");
    }
    return result;
}

std::vector<std::string>
SPDFFileSet::duplicateOutputs(std::vector<SPDFWorkItem> const& items)
{
    std::map<std::string, int> counts;
    std::vector<std::string> result;
    for (auto const& item: items) {
        if (++counts[item.output] == 2) {
            result.push_back(item.output);
        }
    }
    return result;
}
