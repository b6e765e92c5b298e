#include <spdf/assert_test.h>

#include <spdf/SPDFExc.hh>
#include <spdf/SPDFFileSet.hh>
#include <spdf/SUtil.hh>

#include <iostream>
#include <unistd.h>

static void
touch(std::string const& path)
{
    SUtil::make_directories(SUtil::path_dirname(path));
    SUtil::write_file(path.c_str(), "%PDF-1.4\n");
}

static std::string
discovery_error(SPDFRunConfig const& config)
{
    try {
        SPDFFileSet::resolve(config);
    } catch (SPDFExc& e) {
        assert(e.getErrorCode() == spdf_e_discovery);
        return e.getMessageDetail();
    }
    return "";
}

static void
test_batch(std::string const& dir)
{
    auto in = SUtil::path_join(dir, "in");
    auto out = SUtil::path_join(dir, "out");
    touch(SUtil::path_join(in, "b.pdf"));
    touch(SUtil::path_join(in, "a.pdf"));
    touch(SUtil::path_join(in, "notes.txt"));
    touch(SUtil::path_join(in, "sub/c.pdf"));
    touch(SUtil::path_join(in, "sub/deeper/a.pdf"));

    auto config = SPDFRunConfig::Builder().inputDir(in).outputDir(out).build();
    auto items = SPDFFileSet::resolve(config);
    assert(items.size() == 4);
    assert(items.at(0).input == SUtil::path_join(in, "a.pdf"));
    assert(items.at(0).output == SUtil::path_join(out, "sanitized_a.pdf"));
    assert(items.at(0).relative_dir.empty());
    assert(items.at(1).input == SUtil::path_join(in, "b.pdf"));
    assert(items.at(2).input == SUtil::path_join(in, "sub/c.pdf"));
    assert(items.at(2).output == SUtil::path_join(out, "sanitized_c.pdf"));
    assert(items.at(2).relative_dir == "sub");
    assert(items.at(3).input == SUtil::path_join(in, "sub/deeper/a.pdf"));
    assert(items.at(3).relative_dir == "sub/deeper");
    for (size_t i = 0; i < items.size(); ++i) {
        assert(items.at(i).index == i);
    }
    assert(SUtil::is_directory(out));

    // Flattening puts both a.pdf files at the same output.
    auto dups = SPDFFileSet::duplicateOutputs(items);
    assert(dups.size() == 1);
    assert(dups.at(0) == SUtil::path_join(out, "sanitized_a.pdf"));

    // Mirroring keeps them apart.
    auto mirrored = SPDFFileSet::resolve(
        SPDFRunConfig::Builder(config).mirrorDirStructure(true).outputPrefix("clean-").build());
    assert(mirrored.size() == 4);
    assert(mirrored.at(3).output == SUtil::path_join(out, "sub/deeper/clean-a.pdf"));
    assert(SUtil::is_directory(SUtil::path_join(out, "sub/deeper")));
    assert(SPDFFileSet::duplicateOutputs(mirrored).empty());

    // Pattern matches base names only.
    auto only_c = SPDFFileSet::resolve(SPDFRunConfig::Builder(config).filePattern("c*").build());
    assert(only_c.size() == 1);
    assert(only_c.at(0).input == SUtil::path_join(in, "sub/c.pdf"));

    assert(
        discovery_error(SPDFRunConfig::Builder(config).filePattern("*.docx").build()) ==
        "no files matching *.docx found");
}

static void
test_dry_run(std::string const& dir)
{
    auto in = SUtil::path_join(dir, "dry-in");
    auto out = SUtil::path_join(dir, "dry-out");
    touch(SUtil::path_join(in, "sub/x.pdf"));
    auto config = SPDFRunConfig::Builder()
                      .inputDir(in)
                      .outputDir(out)
                      .mirrorDirStructure(true)
                      .dryRun(true)
                      .build();
    auto items = SPDFFileSet::resolve(config);
    assert(items.size() == 1);
    assert(items.at(0).output == SUtil::path_join(out, "sub/sanitized_x.pdf"));
    assert(!SUtil::file_exists(out));
}

static void
test_missing_input(std::string const& dir)
{
    auto config =
        SPDFRunConfig::Builder().inputDir(SUtil::path_join(dir, "nowhere")).build();
    assert(discovery_error(config) == "input directory does not exist");
}

static void
test_explicit_pair(std::string const& dir)
{
    auto output = SUtil::path_join(dir, "single/out/result.pdf");
    auto config = SPDFRunConfig::Builder()
                      .inputDir(SUtil::path_join(dir, "nowhere"))
                      .explicitPair("whatever.pdf", output)
                      .build();
    auto items = SPDFFileSet::resolve(config);
    assert(items.size() == 1);
    assert(items.at(0).input == "whatever.pdf");
    assert(items.at(0).output == output);
    assert(SUtil::is_directory(SUtil::path_dirname(output)));
}

int
main()
{
    std::string templ = SUtil::path_join(SUtil::temp_directory(), "spdf-fileset-XXXXXX");
    assert(mkdtemp(templ.data()) != nullptr);
    test_batch(templ);
    test_dry_run(templ);
    test_missing_input(templ);
    test_explicit_pair(templ);
    SUtil::remove_tree(templ);
    std::cout << "file set tests passed" << std::endl;
    return 0;
}
