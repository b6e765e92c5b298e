#include <spdf/assert_test.h>

#include <spdf/Pl_SHA2.hh>
#include <spdf/Pl_String.hh>

#include <cstring>
#include <stdexcept>

static void
test_vectors()
{
    Pl_SHA2 empty;
    empty.finish();
    assert(
        empty.getHexDigest() ==
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    Pl_SHA2 abc;
    abc.writeCStr("abc");
    abc.finish();
    assert(
        abc.getHexDigest() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(abc.getRawDigest().length() == 32);

    // Same input in pieces
    Pl_SHA2 pieces;
    pieces.writeCStr("ab");
    pieces.writeCStr("");
    pieces.writeCStr("c");
    pieces.finish();
    assert(pieces.getHexDigest() == abc.getHexDigest());
}

static void
test_pass_through()
{
    std::string out;
    Pl_String s("out", nullptr, out);
    Pl_SHA2 sha(&s);
    sha << "abc";
    sha.finish();
    assert(out == "abc");
    assert(
        sha.getHexDigest() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

static void
test_in_progress()
{
    Pl_SHA2 sha;
    sha.writeCStr("abc");
    try {
        sha.getHexDigest();
        assert(false);
    } catch (std::logic_error&) {
        // expected
    }
    try {
        sha.reset();
        assert(false);
    } catch (std::logic_error&) {
        // expected
    }
    sha.finish();
    sha.reset();
    sha.finish();
    assert(
        sha.getHexDigest() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

int
main()
{
    test_vectors();
    test_pass_through();
    test_in_progress();
    return 0;
}
