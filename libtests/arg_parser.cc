#include <spdf/assert_test.h>

#include <spdf/SPDFArgParser.hh>
#include <spdf/SPDFUsage.hh>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static std::vector<char const*>
terminate_args(std::vector<char const*> args)
{
    args.insert(args.begin(), "test_arg_parser");
    args.push_back(nullptr);
    return args;
}

static void
add_food_help(SPDFArgParser& ap)
{
    ap.addBare("potato", []() {});
    ap.addRequiredParameter("salad", [](std::string const&) {}, "tossed");
    ap.addHelpFooter("For more help, read the manual.\n");
    ap.addHelpTopic("food", "food options", "Options that are edible.\n");
    ap.addOptionHelp("--potato", "food", "add a potato", "--potato\n\nAdd a potato.\n");
    ap.addOptionHelp("--salad", "food", "add a salad", "");
}

// The parser keeps a pointer to argv, so the arrays must outlive it.
static std::string
usage_message(std::vector<char const*> args)
{
    auto argv = terminate_args(args);
    SPDFArgParser ap(static_cast<int>(argv.size()) - 1, argv.data());
    ap.addBare("potato", []() {});
    ap.addRequiredParameter("salad", [](std::string const&) {}, "tossed");
    ap.addSoleBare("moo", []() {});
    try {
        ap.parseArgs();
    } catch (SPDFUsage& e) {
        return e.what();
    }
    return "";
}

static void
test_parse()
{
    auto argv =
        terminate_args({"--potato", "in.pdf", "--salad=green", "-salad=caesar", "-", "out.pdf"});
    SPDFArgParser ap(static_cast<int>(argv.size()) - 1, argv.data());
    int potatoes = 0;
    std::vector<std::string> salads;
    std::vector<std::string> positionals;
    ap.addBare("potato", [&potatoes]() { ++potatoes; });
    ap.addRequiredParameter(
        "salad", [&salads](std::string const& x) { salads.push_back(x); }, "tossed");
    ap.addPositional([&positionals](std::string const& x) { positionals.push_back(x); });
    ap.parseArgs();
    assert(potatoes == 1);
    assert((salads == std::vector<std::string>{"green", "caesar"}));
    assert((positionals == std::vector<std::string>{"in.pdf", "-", "out.pdf"}));
    assert(ap.getProgname() == "test_arg_parser");
}

static void
test_registration_errors()
{
    auto argv = terminate_args({});
    SPDFArgParser ap(1, argv.data());
    ap.addBare("potato", []() {});
    ap.addSoleBare("moo", []() {});
    for (auto name: {"potato", "moo", "help", ""}) {
        try {
            ap.addRequiredParameter(name, [](std::string const&) {}, "x");
            assert(false);
        } catch (std::logic_error&) {
            // expected
        }
    }
}

static void
test_usage_errors()
{
    assert(usage_message({"--potato"}).empty());
    assert(usage_message({"--carrot"}) == "unrecognized argument --carrot");
    assert(usage_message({"--salad"}) == "--salad must be given as --salad=tossed");
    assert(
        usage_message({"--potato=mashed"}) ==
        "--potato does not take a parameter, but \"mashed\" was given");
    assert(usage_message({"positional"}) == "unrecognized argument positional");
    assert(usage_message({"--=x"}) == "unrecognized argument --=x");
    assert(usage_message({"---potato"}) == "unrecognized argument ---potato");
    // Help and sole options are only recognized as the sole argument.
    assert(usage_message({"--potato", "--help"}) == "unrecognized argument --help");
    assert(usage_message({"--moo", "--potato"}) == "unrecognized argument --moo");
}

static void
test_help()
{
    auto argv = terminate_args({});
    SPDFArgParser ap(1, argv.data());
    add_food_help(ap);
    auto top = ap.getHelp("");
    assert(top.find("Run \"test_arg_parser --help=topic\" for help on a topic.") == 0);
    assert(top.find("  food: food options\n") != std::string::npos);
    assert(top.find("For more help, read the manual.") != std::string::npos);

    auto food = ap.getHelp("food");
    assert(food.find("Options that are edible.\n") == 0);
    assert(food.find("Related options:\n  --potato: add a potato\n  --salad: add a salad\n") !=
           std::string::npos);

    // Option help without long text shows the short text.
    auto salad = ap.getHelp("--salad");
    assert(salad.find("add a salad\n") == 0);

    auto all = ap.getHelp("all");
    assert(all.find("== food (food options) ==") != std::string::npos);
    assert(all.find("== --potato (add a potato) ==") != std::string::npos);
    assert(all.find("Add a potato.\n") != std::string::npos);

    try {
        ap.getHelp("drinks");
        assert(false);
    } catch (SPDFUsage& e) {
        assert(std::string(e.what()) == "unknown help option drinks");
    }
}

static void
test_help_registration_errors()
{
    auto argv = terminate_args({});
    SPDFArgParser ap(1, argv.data());
    add_food_help(ap);
    try {
        ap.addHelpTopic("all", "everything", "");
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ap.addHelpTopic("food", "again", "");
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ap.addOptionHelp("-potato", "food", "bad", "");
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ap.addOptionHelp("--turnip", "drink", "no topic", "");
        assert(false);
    } catch (std::logic_error&) {
    }
}

int
main()
{
    test_parse();
    test_registration_errors();
    test_usage_errors();
    test_help();
    test_help_registration_errors();
    std::cout << "arg parser tests passed" << std::endl;
    return 0;
}
