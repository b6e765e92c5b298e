#include <spdf/assert_test.h>

#include <spdf/Pl_String.hh>
#include <spdf/SPDFExternalTools.hh>
#include <spdf/SUtil.hh>

#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

// Stand-ins for the real tools. Each appends its arguments to
// tools.log in its own directory and imitates the real tool's exit
// status and output closely enough to exercise the interpretation.
static char const* fake_qpdf = R"(#!/bin/sh
log="$(dirname "$0")/tools.log"
echo "qpdf $*" >> "$log"
case "$1" in
  --is-encrypted)
    case "$2" in
      *broken*) echo "qpdf: $2: not a PDF file" >&2; exit 2 ;;
      *missing*) echo "qpdf: open $2: No such file or directory" >&2; exit 1 ;;
      *locked*) exit 0 ;;
      *) exit 2 ;;
    esac ;;
  --password-file=-)
    IFS= read -r pw
    if [ "$pw" != "open sesame" ]; then
      echo "qpdf: $3: invalid password" >&2
      exit 2
    fi
    cp "$3" "$4"
    exit 0 ;;
  --linearize)
    cp "$2" "$3"
    echo "WARNING: $2: file is damaged" >&2
    exit 3 ;;
  @-)
    n=0
    while IFS= read -r line; do
      echo "arg: $line" >> "$log"
      case "$line" in
        --|--encrypt|--allow-weak-crypto|--user-password=*|--owner-password=*|--bits=*|--use-aes=*) ;;
        -*) echo "qpdf: unrecognized argument $line" >&2; exit 2 ;;
      esac
      if [ $n -eq 0 ]; then first="$line"; fi
      last="$line"
      n=$((n + 1))
    done
    cp "$first" "$last"
    exit 0 ;;
esac
echo "qpdf: unexpected arguments" >&2
exit 2
)";

static char const* fake_pdfdetach = R"(#!/bin/sh
echo "pdfdetach $*" >> "$(dirname "$0")/tools.log"
case "$4" in
  *empty*) ;;
  *) echo one > "$3/one.txt"; echo two > "$3/two.bin" ;;
esac
exit 0
)";

static char const* fake_exiftool = R"(#!/bin/sh
echo "exiftool $*" >> "$(dirname "$0")/tools.log"
for last; do :; done
cp "$last" "${last}_original"
echo "scrubbed" >> "$last"
echo "    1 image files updated"
exit 0
)";

static char const* fake_gs = R"(#!/bin/sh
echo "gs $*" >> "$(dirname "$0")/tools.log"
for a; do
  case "$a" in
    -sOutputFile=*) out="${a#-sOutputFile=}" ;;
  esac
  last="$a"
done
case "$last" in
  *fail*) echo "Unrecoverable error, exit code 1" >&2; exit 1 ;;
esac
cp "$last" "$out"
case "$last" in
  *warn*) echo "   **** Warning: An error occurred while reading an XREF table." ;;
esac
exit 0
)";

static std::string
install(std::string const& dir, std::string const& name, char const* script)
{
    auto path = SUtil::path_join(dir, name);
    SUtil::write_file(path.c_str(), script);
    assert(chmod(path.c_str(), 0755) == 0);
    return path;
}

static std::string
contents(std::string const& path)
{
    std::string result;
    Pl_String p("contents", nullptr, result);
    SUtil::pipe_file(path.c_str(), &p);
    return result;
}

static void
test_interpret_exit()
{
    using R = SPDFStageResult;
    auto r = SPDFExternalTools::interpretExit("gs", false, 0, "", "", "out.pdf");
    assert(r.status == R::st_applied);
    assert(r.artifact == "out.pdf");

    r = SPDFExternalTools::interpretExit(
        "gs", false, 0, "Page 1\n   **** Warning: bad font\n", "", "out.pdf");
    assert(r.status == R::st_applied_with_warning);
    assert(r.detail == "Warning: bad font");

    r = SPDFExternalTools::interpretExit(
        "exiftool", false, 0, "", "Warning: [minor] Ignored empty value\n", "a.pdf");
    assert(r.status == R::st_applied_with_warning);
    assert(r.detail == "Warning: [minor] Ignored empty value");

    r = SPDFExternalTools::interpretExit(
        "qpdf", true, 3, "", "WARNING: a.pdf: object 7 0: damaged\n", "b.pdf");
    assert(r.status == R::st_applied_with_warning);
    assert(r.artifact == "b.pdf");
    assert(r.detail == "WARNING: a.pdf: object 7 0: damaged");

    r = SPDFExternalTools::interpretExit("qpdf", true, 3, "", "", "b.pdf");
    assert(r.status == R::st_applied_with_warning);
    assert(r.detail == "qpdf reported warnings");

    // Exit status 3 only means warnings for qpdf.
    r = SPDFExternalTools::interpretExit("gs", false, 3, "", "", "b.pdf");
    assert(r.status == R::st_failed);
    assert(r.detail == "gs exited with status 3");

    r = SPDFExternalTools::interpretExit(
        "qpdf", true, 2, "", "first\nqpdf: a.pdf: invalid password\n\n", "b.pdf");
    assert(r.status == R::st_failed);
    assert(r.detail == "qpdf exited with status 2: qpdf: a.pdf: invalid password");
}

static void
test_probe(std::string const& dir, SPDFStageSet const& s)
{
    std::string detail;
    assert(s.probe->probe(SUtil::path_join(dir, "locked.pdf"), detail) ==
           SPDFEncryptionProbe::pr_encrypted);
    assert(s.probe->probe(SUtil::path_join(dir, "plain.pdf"), detail) ==
           SPDFEncryptionProbe::pr_not_encrypted);
    assert(detail.empty());
    auto missing = SUtil::path_join(dir, "missing.pdf");
    assert(s.probe->probe(missing, detail) == SPDFEncryptionProbe::pr_error);
    assert(detail.find("--is-encrypted exited with status 1: qpdf: open " + missing) !=
           std::string::npos);

    auto none = SPDFExternalTools::create(
        SPDFRunConfig::Builder().qpdfProgram(SUtil::path_join(dir, "no-such-qpdf")).build());
    detail.clear();
    assert(none.probe->probe("x.pdf", detail) == SPDFEncryptionProbe::pr_error);
    assert(detail.find("exited with status 127") != std::string::npos);
    assert(detail.find("unable to run") != std::string::npos);
}

static void
test_unlock(std::string const& dir, SPDFStageSet const& s)
{
    auto in = SUtil::path_join(dir, "locked.pdf");
    SPDFStageRequest req;
    req.input = in;
    req.output = SUtil::path_join(dir, "unlocked.pdf");
    req.password = "open sesame";
    auto r = s.unlock->run(req);
    assert(r.status == SPDFStageResult::st_applied);
    assert(r.artifact == req.output);
    assert(contents(req.output) == "locked document\n");

    req.password = "guess";
    req.output = SUtil::path_join(dir, "unlocked2.pdf");
    r = s.unlock->run(req);
    assert(r.status == SPDFStageResult::st_failed);
    assert(r.detail == "decryption failed: " + SUtil::path_join(dir, "qpdf") +
                           " exited with status 2: qpdf: " + in + ": invalid password");
    assert(!SUtil::file_exists(req.output));

    // The password is never on the command line.
    assert(contents(SUtil::path_join(dir, "tools.log")).find("sesame") == std::string::npos);
}

static void
test_linearize(std::string const& dir, SPDFStageSet const& s)
{
    SPDFStageRequest req;
    req.input = SUtil::path_join(dir, "plain.pdf");
    req.output = SUtil::path_join(dir, "linear.pdf");
    auto r = s.sanitize->run(req);
    assert(r.status == SPDFStageResult::st_applied_with_warning);
    assert(r.detail == "WARNING: " + req.input + ": file is damaged");
    assert(contents(req.output) == "plain document\n");
}

static void
test_detach(std::string const& dir, SPDFStageSet const& s)
{
    SPDFStageRequest req;
    req.input = SUtil::path_join(dir, "plain.pdf");
    req.output = SUtil::path_join(dir, "plain_attachments");
    auto r = s.attachments->run(req);
    assert(r.status == SPDFStageResult::st_applied);
    assert(r.artifact == req.input);
    assert(r.attachments.size() == 2);
    assert(r.attachments.at(0) == SUtil::path_join(req.output, "one.txt"));
    assert(r.attachments.at(1) == SUtil::path_join(req.output, "two.bin"));

    req.input = SUtil::path_join(dir, "empty.pdf");
    req.output = SUtil::path_join(dir, "empty_attachments");
    r = s.attachments->run(req);
    assert(r.status == SPDFStageResult::st_applied);
    assert(r.attachments.empty());
    assert(SUtil::is_directory(req.output));
}

static void
test_metadata(std::string const& dir, SPDFStageSet const& s)
{
    auto doc = SUtil::path_join(dir, "meta.pdf");
    SUtil::write_file(doc.c_str(), "meta\n");
    SPDFStageRequest req;
    req.input = doc;
    req.output = doc;
    auto r = s.metadata->run(req);
    assert(r.status == SPDFStageResult::st_applied);
    assert(r.artifact == doc);
    assert(contents(doc) == "meta\nscrubbed\n");
    auto log = contents(SUtil::path_join(dir, "tools.log"));
    assert(log.find("exiftool -all= -XMP:Author= " + doc + "\n") != std::string::npos);
}

static void
test_rewrite(std::string const& dir, SPDFStageSet const& s)
{
    SPDFStageRequest req;
    req.input = SUtil::path_join(dir, "plain.pdf");
    req.output = SUtil::path_join(dir, "rewritten.pdf");
    auto r = s.rewrite->run(req);
    assert(r.status == SPDFStageResult::st_applied);
    assert(contents(req.output) == "plain document\n");
    auto log = contents(SUtil::path_join(dir, "tools.log"));
    assert(log.find("gs -q -dSAFER -dBATCH -dNOPAUSE -sDEVICE=pdfwrite "
                    "-dPDFSETTINGS=/screen -sOutputFile=" +
                    req.output + " " + req.input + "\n") != std::string::npos);

    req.input = SUtil::path_join(dir, "warn.pdf");
    req.output = SUtil::path_join(dir, "rewritten-warn.pdf");
    r = s.rewrite->run(req);
    assert(r.status == SPDFStageResult::st_applied_with_warning);
    assert(r.detail == "Warning: An error occurred while reading an XREF table.");

    req.input = SUtil::path_join(dir, "fail.pdf");
    req.output = SUtil::path_join(dir, "rewritten-fail.pdf");
    r = s.rewrite->run(req);
    assert(r.status == SPDFStageResult::st_failed);
    assert(r.detail.find("exited with status 1: Unrecoverable error, exit code 1") !=
           std::string::npos);
}

static void
test_relock(
    std::string const& dir,
    spdf_encryption_strength_e bits,
    std::string const& password,
    std::string const& expected)
{
    auto log_path = SUtil::path_join(dir, "tools.log");
    SUtil::write_file(log_path.c_str(), "");
    auto s = SPDFExternalTools::create(SPDFRunConfig::Builder()
                                           .qpdfProgram(SUtil::path_join(dir, "qpdf"))
                                           .encryptionStrength(bits)
                                           .build());
    SPDFStageRequest req;
    req.input = SUtil::path_join(dir, "plain.pdf");
    req.output = SUtil::path_join(dir, "relocked.pdf");
    req.password = password;
    auto r = s.relock->run(req);
    assert(r.status == SPDFStageResult::st_applied);
    assert(r.artifact == req.output);
    assert(contents(req.output) == "plain document\n");
    auto log = contents(log_path);
    assert(log == "qpdf @-\narg: " + req.input + "\n" + expected + "arg: --\narg: " + req.output +
               "\n");
}

static void
test_missing_output(std::string const& dir)
{
    // A tool that reports success without writing its output fails.
    auto liar = install(dir, "liar", "#!/bin/sh\nexit 0\n");
    auto s = SPDFExternalTools::create(SPDFRunConfig::Builder().ghostscriptProgram(liar).build());
    SPDFStageRequest req;
    req.input = SUtil::path_join(dir, "plain.pdf");
    req.output = SUtil::path_join(dir, "never.pdf");
    auto r = s.rewrite->run(req);
    assert(r.status == SPDFStageResult::st_failed);
    assert(r.detail == liar + " did not create " + req.output);
}

int
main()
{
    std::string dir = SUtil::path_join(SUtil::temp_directory(), "spdf-tools-XXXXXX");
    assert(mkdtemp(dir.data()) != nullptr);
    install(dir, "qpdf", fake_qpdf);
    install(dir, "pdfdetach", fake_pdfdetach);
    install(dir, "exiftool", fake_exiftool);
    install(dir, "gs", fake_gs);
    for (auto name: {"locked", "plain", "empty", "warn", "fail"}) {
        auto path = SUtil::path_join(dir, std::string(name) + ".pdf");
        SUtil::write_file(path.c_str(), std::string(name) + " document\n");
    }

    auto s = SPDFExternalTools::create(SPDFRunConfig::Builder()
                                           .qpdfProgram(SUtil::path_join(dir, "qpdf"))
                                           .pdfdetachProgram(SUtil::path_join(dir, "pdfdetach"))
                                           .exiftoolProgram(SUtil::path_join(dir, "exiftool"))
                                           .exiftoolArgs({"-all=", "-XMP:Author="})
                                           .ghostscriptProgram(SUtil::path_join(dir, "gs"))
                                           .quality(spdf_quality_screen)
                                           .build());
    test_interpret_exit();
    test_probe(dir, s);
    test_unlock(dir, s);
    test_linearize(dir, s);
    test_detach(dir, s);
    test_metadata(dir, s);
    test_rewrite(dir, s);
    test_relock(
        dir,
        spdf_bits_40,
        "pw with spaces",
        "arg: --allow-weak-crypto\narg: --encrypt\narg: --user-password=pw with spaces\n"
        "arg: --owner-password=pw with spaces\narg: --bits=40\n");
    test_relock(
        dir,
        spdf_bits_128,
        "pw with spaces",
        "arg: --encrypt\narg: --user-password=pw with spaces\n"
        "arg: --owner-password=pw with spaces\narg: --bits=128\narg: --use-aes=y\n");
    test_relock(
        dir,
        spdf_bits_256,
        "pw with spaces",
        "arg: --encrypt\narg: --user-password=pw with spaces\n"
        "arg: --owner-password=pw with spaces\narg: --bits=256\n");
    // A password that looks like an option is still a password.
    test_relock(
        dir,
        spdf_bits_256,
        "-secret",
        "arg: --encrypt\narg: --user-password=-secret\narg: --owner-password=-secret\n"
        "arg: --bits=256\n");
    test_missing_output(dir);
    SUtil::remove_tree(dir);
    std::cout << "external tools tests passed" << std::endl;
    return 0;
}
