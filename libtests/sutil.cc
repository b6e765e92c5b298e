#include <spdf/assert_test.h>

#include <spdf/Pl_String.hh>
#include <spdf/SPDFSystemError.hh>
#include <spdf/SUtil.hh>

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

static void
test_numbers()
{
    assert(SUtil::int_to_string(7) == "7");
    assert(SUtil::int_to_string(7, 3) == "007");
    assert(SUtil::int_to_string(-7, 3) == "-07");
    assert(SUtil::string_to_int("120") == 120);
    assert(SUtil::string_to_int("-3") == -3);
    assert(SUtil::is_number("256"));
    assert(!SUtil::is_number(""));
    assert(!SUtil::is_number("12s"));
    assert(!SUtil::is_number("99999999999"));
    try {
        SUtil::string_to_int("forty");
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "invalid integer forty");
    }
}

static void
test_paths()
{
    assert(SUtil::path_basename("a/b/c.pdf") == "c.pdf");
    assert(SUtil::path_basename("c.pdf") == "c.pdf");
    assert(SUtil::path_basename("a/b/") == "b");
    assert(SUtil::path_basename("/") == "/");
    assert(SUtil::path_dirname("a/b/c.pdf") == "a/b");
    assert(SUtil::path_dirname("c.pdf") == "");
    assert(SUtil::path_dirname("/c.pdf") == "/");
    assert(SUtil::path_dirname("a/b/") == "a");
    assert(SUtil::path_stem("dir/report.final.pdf") == "report.final");
    assert(SUtil::path_stem(".hidden") == ".hidden");
    assert(SUtil::path_extension("dir/report.final.pdf") == ".pdf");
    assert(SUtil::path_extension("dir/README") == "");
    assert(SUtil::path_join("a", "b") == "a/b");
    assert(SUtil::path_join("a/", "b") == "a/b");
    assert(SUtil::path_join("", "b") == "b");
    assert(SUtil::path_join("a", "") == "a");
}

static void
test_strings()
{
    assert(SUtil::glob_match("*.pdf", "x.pdf"));
    assert(!SUtil::glob_match("*.pdf", "x.PDF"));
    assert(SUtil::glob_match("report_??.pdf", "report_01.pdf"));
    assert(!SUtil::glob_match("report_??.pdf", "report_1.pdf"));
    assert(SUtil::hex_encode(std::string("\x00\x7f\xff", 3)) == "007fff");
    auto r = SUtil::random_hex(8);
    assert(r.length() == 16);
    assert(r.find_first_not_of("0123456789abcdef") == std::string::npos);
    assert(SUtil::random_hex(8) != r);
    assert(SUtil::str_tolower("/PrePress") == "/prepress");
    assert(SUtil::trim("  a b \t\n") == "a b");
    assert(SUtil::trim(" \t ") == "");
    auto words = SUtil::split_words("  -all=  -XMP:Author= \t-q ");
    assert(words.size() == 3);
    assert(words.at(0) == "-all=");
    assert(words.at(1) == "-XMP:Author=");
    assert(words.at(2) == "-q");
    assert(SUtil::split_words("   ").empty());
    char argv0[] = "/usr/local/bin/spdf";
    assert(std::string(SUtil::getWhoami(argv0)) == "spdf");
    auto ts = SUtil::current_timestamp();
    assert(ts.length() == 19);
    assert((ts.at(4) == '-') && (ts.at(10) == ' ') && (ts.at(13) == ':'));
}

static void
test_files(std::string const& dir)
{
    auto a = SUtil::path_join(dir, "a.txt");
    auto b = SUtil::path_join(dir, "b.txt");
    assert(!SUtil::file_exists(a));
    assert(!SUtil::file_can_be_opened(a.c_str()));
    SUtil::write_file(a.c_str(), "line one\nline two\n");
    assert(SUtil::file_exists(a));
    assert(SUtil::file_can_be_opened(a.c_str()));
    assert(!SUtil::file_can_be_opened(dir.c_str()));
    assert(SUtil::is_directory(dir));
    assert(!SUtil::is_directory(a));

    auto lines = SUtil::read_lines_from_file(a.c_str());
    assert(lines.size() == 2);
    assert(lines.front() == "line one");
    assert(lines.back() == "line two");

    SUtil::copy_file(a.c_str(), b.c_str());
    std::string copied;
    Pl_String p("copy", nullptr, copied);
    SUtil::pipe_file(b.c_str(), &p);
    assert(copied == "line one\nline two\n");

    auto moved = SUtil::path_join(dir, "moved.txt");
    SUtil::move_file(b.c_str(), moved.c_str());
    assert(!SUtil::file_exists(b));
    assert(SUtil::file_exists(moved));
    SUtil::remove_file(moved.c_str());
    assert(!SUtil::file_exists(moved));

    try {
        SUtil::remove_file(moved.c_str());
        assert(false);
    } catch (SPDFSystemError& e) {
        assert(e.getErrno() == ENOENT);
    }
    try {
        SUtil::safe_fopen(moved.c_str(), "rb");
        assert(false);
    } catch (SPDFSystemError& e) {
        assert(e.getErrno() == ENOENT);
    }
}

static void
test_directories(std::string const& dir)
{
    auto tree = SUtil::path_join(dir, "tree");
    SUtil::make_directories(SUtil::path_join(tree, "z/deep"));
    SUtil::make_directories(SUtil::path_join(tree, "b"));
    // Creating an existing directory is not an error.
    SUtil::make_directories(SUtil::path_join(tree, "b"));
    SUtil::write_file(SUtil::path_join(tree, "top.pdf").c_str(), "1");
    SUtil::write_file(SUtil::path_join(tree, "b/mid.pdf").c_str(), "2");
    SUtil::write_file(SUtil::path_join(tree, "z/deep/low.pdf").c_str(), "3");
    SUtil::write_file(SUtil::path_join(tree, "a.txt").c_str(), "4");

    auto all = SUtil::list_files_recursive(tree);
    assert(all.size() == 4);
    assert(all.at(0) == "a.txt");
    assert(all.at(1) == "b/mid.pdf");
    assert(all.at(2) == "top.pdf");
    assert(all.at(3) == "z/deep/low.pdf");

    auto top = SUtil::list_files(tree);
    assert(top.size() == 2);
    assert(top.at(0) == SUtil::path_join(tree, "a.txt"));
    assert(top.at(1) == SUtil::path_join(tree, "top.pdf"));

    try {
        SUtil::list_files(SUtil::path_join(tree, "missing"));
        assert(false);
    } catch (SPDFSystemError& e) {
        assert(e.getErrno() == ENOENT);
    }

    SUtil::remove_tree(tree);
    assert(!SUtil::file_exists(tree));
    // Removing something that isn't there is fine.
    SUtil::remove_tree(tree);
}

int
main()
{
    std::string templ = SUtil::path_join(SUtil::temp_directory(), "spdf-sutil-XXXXXX");
    assert(mkdtemp(templ.data()) != nullptr);
    test_numbers();
    test_paths();
    test_strings();
    test_files(templ);
    test_directories(templ);
    SUtil::remove_tree(templ);
    std::cout << "sutil tests passed" << std::endl;
    return 0;
}
