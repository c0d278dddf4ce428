#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging.hh"
#include "rules.hh"
#include "serial.hh"

#define ASSERT(check, msg) \
    if (!(check)) throw std::runtime_error(msg)

#define PARSE_OK(input, count) \
    do { \
        std::vector<FirewallRule> rules; \
        std::optional<ParseError> err = parse_rules(input, &rules); \
        if (err) \
            throw std::runtime_error("Parsing " #input " should have" \
                                     " succeeded but failed with: " + \
                                     err->message); \
        if (rules.size() != count) \
            throw std::runtime_error("Parsing " #input " should have" \
                                     " resulted in " #count " rule(s) but" \
                                     " got " + std::to_string(rules.size()) \
                                     + "."); \
    } while (0)

static std::vector<FirewallRule> parse_ok(const std::string &input)
{
    std::vector<FirewallRule> rules;
    std::optional<ParseError> err = parse_rules(input, &rules);
    if (err) {
        throw std::runtime_error("Parsing '" + input + "' failed at line "
                                 + std::to_string(err->line) + ", column "
                                 + std::to_string(err->column) + ": "
                                 + err->message);
    }
    return rules;
}

static ParseError parse_fail(const std::string &input)
{
    std::vector<FirewallRule> rules;
    std::optional<ParseError> err = parse_rules(input, &rules);
    if (!err) {
        throw std::runtime_error("Parsing '" + input + "' should have"
                                 " failed but resulted in "
                                 + std::to_string(rules.size())
                                 + " rule(s).");
    }
    return *err;
}

static void check_error(const ParseError &err, ErrorKind kind, size_t line,
                        size_t column, const std::string &literal = "")
{
    ASSERT(err.kind == kind, std::string("Expected error kind '")
           + describe_error_kind(kind) + "' but got '"
           + describe_error_kind(err.kind) + "': " + err.message);
    ASSERT(err.line == line && err.column == column,
           "Expected error at " + std::to_string(line) + ':'
           + std::to_string(column) + " but got "
           + std::to_string(err.line) + ':' + std::to_string(err.column)
           + ": " + err.message);
    ASSERT(err.literal == literal, "Expected literal '" + literal
           + "' but got '" + err.literal + "'.");
}

static void test_service_rule(void)
{
    std::vector<FirewallRule> rules = parse_ok("allow ssh");
    ASSERT(rules.size() == 1, "Expected exactly one rule.");

    const ServiceRule *svc = std::get_if<ServiceRule>(&rules[0]);
    ASSERT(svc != nullptr, "Rule should be a service rule.");
    ASSERT(svc->action == Action::ALLOW, "Action should be allow.");
    ASSERT(svc->service == "ssh", "Service should be 'ssh'.");

    rules = parse_ok("reject my_service-2 # comment");
    svc = std::get_if<ServiceRule>(&rules.at(0));
    ASSERT(svc != nullptr, "Rule with comment should be a service rule.");
    ASSERT(svc->action == Action::REJECT, "Action should be reject.");
    ASSERT(svc->service == "my_service-2", "Wrong service name.");
}

static void test_address_rule(void)
{
    std::vector<FirewallRule> rules = parse_ok(
        "allow in on eth0 from internal to external port 443 proto tcp"
    );
    ASSERT(rules.size() == 1, "Expected exactly one rule.");

    AddressRule expected;
    expected.action = Action::ALLOW;
    expected.direction = RuleDir::INCOMING;
    expected.interface = "eth0";
    expected.clauses = {
        FromClause{AddrKeyword::INTERNAL},
        ToClause{AddrKeyword::EXTERNAL},
        PortClause{443},
        ProtoClause{Protocol::TCP}
    };
    ASSERT(rules[0] == FirewallRule(expected),
           "Unexpected rule: " + serialise(rules[0]));

    rules = parse_ok("deny out to 8.8.8.8 port 53 proto udp");
    expected = AddressRule();
    expected.action = Action::DENY;
    expected.direction = RuleDir::OUTGOING;
    expected.clauses = {
        ToClause{IpSpec(IpSpec::Family::INET, "8.8.8.8")},
        PortClause{53},
        ProtoClause{Protocol::UDP}
    };
    ASSERT(rules.at(0) == FirewallRule(expected),
           "Unexpected rule: " + serialise(rules.at(0)));

    const AddressRule &addr = std::get<AddressRule>(rules[0]);
    ASSERT(!addr.interface, "Interface should not be set.");
}

static void test_ip_literals(void)
{
    std::vector<FirewallRule> rules = parse_ok(
        "allow from 10.0.0.0/8 to 2001:db8::/32\n"
        "allow from ::1 to 0.0.0.0/0\n"
        "allow from fe80::1/128 to 255.255.255.255/32\n"
    );
    ASSERT(rules.size() == 3, "Expected three rules.");

    const AddressRule &first = std::get<AddressRule>(rules[0]);
    ASSERT(first.clauses.size() == 2, "Expected two clauses.");
    ASSERT(std::get<FromClause>(first.clauses[0]).addr
           == Addr(IpSpec(IpSpec::Family::INET, "10.0.0.0", 8)),
           "Wrong IPv4 network.");
    ASSERT(std::get<ToClause>(first.clauses[1]).addr
           == Addr(IpSpec(IpSpec::Family::INET6, "2001:db8::", 32)),
           "Wrong IPv6 network.");

    const AddressRule &second = std::get<AddressRule>(rules[1]);
    ASSERT(std::get<FromClause>(second.clauses[0]).addr
           == Addr(IpSpec(IpSpec::Family::INET6, "::1")),
           "Wrong IPv6 loopback address.");
    ASSERT(std::get<ToClause>(second.clauses[1]).addr
           == Addr(IpSpec(IpSpec::Family::INET, "0.0.0.0", 0)),
           "Wrong default route.");

    PARSE_OK("allow to any port 0", 1);
    PARSE_OK("allow to any port 65535", 1);
    PARSE_OK("allow from 010.001.000.255/032", 1);

    rules = parse_ok("allow from 0001.1.1.1 to 00.0000.0.00255");
    const AddressRule &zeros = std::get<AddressRule>(rules.at(0));
    ASSERT(std::get<FromClause>(zeros.clauses[0]).addr
           == Addr(IpSpec(IpSpec::Family::INET, "0001.1.1.1")),
           "Address with leading zeros should be kept as written.");

    check_error(parse_fail("allow from 1.1.1.0256"),
                ErrorKind::INVALID_IP_OCTET, 1, 18, "0256");
}

static void test_empty_inputs(void)
{
    PARSE_OK("", 0);
    PARSE_OK("\n", 0);
    PARSE_OK("   \t  ", 0);
    PARSE_OK(" \n\t\n\r\n", 0);
    PARSE_OK("# just a comment", 0);
    PARSE_OK("# one\n  # two\n\n#three\n", 0);
}

/* Every line with a rule results in exactly one entity, in source order. */
static void test_rule_count(void)
{
    std::string input =
        "# header\n"
        "allow ssh\n"
        "\n"
        "deny out to 8.8.8.8 port 53 proto udp # dns\r\n"
        "limit in port 22\n"
        "   # indented comment\n"
        "reject proto any\n"
        "allow http";

    std::vector<FirewallRule> rules = parse_ok(input);
    ASSERT(rules.size() == 5, "Expected five rules but got "
           + std::to_string(rules.size()) + ".");

    ASSERT(std::holds_alternative<ServiceRule>(rules[0]), "Rule 1 kind.");
    ASSERT(std::holds_alternative<AddressRule>(rules[1]), "Rule 2 kind.");
    ASSERT(std::get<AddressRule>(rules[2]).action == Action::LIMIT,
           "Rule 3 should be a limit rule.");
    ASSERT(std::get<AddressRule>(rules[3]).action == Action::REJECT,
           "Rule 4 should be a reject rule.");
    ASSERT(std::get<ServiceRule>(rules[4]).service == "http",
           "Rule 5 should be for http.");
}

static void test_interface_names(void)
{
    std::vector<FirewallRule> rules = parse_ok("allow on to-lan to any");
    const AddressRule &rule = std::get<AddressRule>(rules.at(0));
    ASSERT(rule.interface == std::optional<std::string>("to-lan"),
           "Interface should be 'to-lan'.");
    ASSERT(rule.clauses.size() == 1, "Expected a single clause.");

    // Keywords are not interface names.
    check_error(parse_fail("allow on to to any"), ErrorKind::SYNTAX, 1, 7);
    check_error(parse_fail("deny in on from from any"),
                ErrorKind::SYNTAX, 1, 9);
}

static void test_duplicate_clauses(void)
{
    std::vector<FirewallRule> rules =
        parse_ok("allow port 22 port 2222 from any from 10.0.0.1");
    const AddressRule &rule = std::get<AddressRule>(rules.at(0));

    ASSERT(rule.clauses.size() == 4, "All clauses should be retained.");
    ASSERT(std::get<PortClause>(rule.clauses[0]).port == 22,
           "First port clause should come first.");
    ASSERT(std::get<PortClause>(rule.clauses[1]).port == 2222,
           "Second port clause should come second.");
    ASSERT(std::holds_alternative<FromClause>(rule.clauses[2]),
           "Third clause should be a from clause.");
    ASSERT(std::holds_alternative<FromClause>(rule.clauses[3]),
           "Fourth clause should be a from clause.");
}

static void test_syntax_errors(void)
{
    ParseError err = parse_fail("allow");
    check_error(err, ErrorKind::SYNTAX, 1, 6);
    ASSERT(err.is_syntax_error(), "Should be a syntax error.");
    ASSERT(!err.expected.empty(), "Expected alternatives are missing.");

    // A service rule has no room for clauses.
    check_error(parse_fail("allow ssh from any"), ErrorKind::SYNTAX, 1, 11);
    check_error(parse_fail("allow ssh port 22"), ErrorKind::SYNTAX, 1, 11);

    check_error(parse_fail("block ssh"), ErrorKind::SYNTAX, 1, 1);
    check_error(parse_fail("Allow ssh"), ErrorKind::SYNTAX, 1, 1);
    check_error(parse_fail("allow in"), ErrorKind::SYNTAX, 1, 9);
    check_error(parse_fail("allow from"), ErrorKind::SYNTAX, 1, 11);
    check_error(parse_fail("allow from localhost"), ErrorKind::SYNTAX, 1, 12);
    check_error(parse_fail("allow port http"), ErrorKind::SYNTAX, 1, 12);
    check_error(parse_fail("allow proto icmp"), ErrorKind::SYNTAX, 1, 13);
    check_error(parse_fail("allow port 22 garbage"),
                ErrorKind::SYNTAX, 1, 15);
    check_error(parse_fail("allow ssh!"), ErrorKind::SYNTAX, 1, 10);

    err = parse_fail("allow ssh\n"
                     "# comment\n"
                     "\n"
                     "deny out to 8.8.8.8 port\n"
                     "allow http\n");
    check_error(err, ErrorKind::SYNTAX, 4, 25);
    ASSERT(err.offset == 45, "Wrong offset " + std::to_string(err.offset)
           + " for syntax error on line 4.");

    err = parse_fail("allow ssh\r\nallow\r\n");
    check_error(err, ErrorKind::SYNTAX, 2, 6);
    ASSERT(err.message.find("but found end of line") != std::string::npos,
           "Message should mention the end of line: " + err.message);
}

static void test_validation_errors(void)
{
    ParseError err = parse_fail("allow port 99999 proto tcp");
    check_error(err, ErrorKind::PORT_OUT_OF_RANGE, 1, 12, "99999");
    ASSERT(!err.is_syntax_error(), "Should not be a syntax error.");
    ASSERT(err.message == "port number \"99999\" is not in range 0..65535",
           "Unexpected message: " + err.message);

    check_error(parse_fail("allow port 65536"),
                ErrorKind::PORT_OUT_OF_RANGE, 1, 12, "65536");
    check_error(parse_fail("allow port 123456789012345678901234567890"),
                ErrorKind::PORT_OUT_OF_RANGE, 1, 12,
                "123456789012345678901234567890");

    err = parse_fail("allow from 999.1.1.1");
    check_error(err, ErrorKind::INVALID_IP_OCTET, 1, 12, "999");
    ASSERT(err.message == "octet \"999\" of IPv4 address \"999.1.1.1\" is"
           " not in range 0..255", "Unexpected message: " + err.message);

    check_error(parse_fail("deny to 10.0.256.1 port 22"),
                ErrorKind::INVALID_IP_OCTET, 1, 14, "256");
    check_error(parse_fail("deny to 1.2.3.4444"),
                ErrorKind::INVALID_IP_OCTET, 1, 15, "4444");

    err = parse_fail("allow from 10.0.0.0/33");
    check_error(err, ErrorKind::INVALID_CIDR_PREFIX, 1, 21, "33");
    ASSERT(err.message == "prefix length \"33\" is not in range 0..32 for"
           " IPv4 address \"10.0.0.0\"", "Unexpected message: "
           + err.message);

    check_error(parse_fail("allow to 2001:db8::/129"),
                ErrorKind::INVALID_CIDR_PREFIX, 1, 21, "129");

    err = parse_fail("allow from 1:2:3");
    check_error(err, ErrorKind::INVALID_IP_ADDRESS, 1, 12, "1:2:3");
    ASSERT(err.message == "\"1:2:3\" is not a valid IPv6 address",
           "Unexpected message: " + err.message);

    check_error(parse_fail("allow from 1::2::3"),
                ErrorKind::INVALID_IP_ADDRESS, 1, 12, "1::2::3");
}

/* An invalid literal on a line before a syntax error is reported first. On
 * the failing line itself, the syntax error wins.
 */
static void test_first_error(void)
{
    check_error(parse_fail("allow port 99999 garbage"),
                ErrorKind::SYNTAX, 1, 18);

    check_error(parse_fail("allow port 70000\nallow from"),
                ErrorKind::PORT_OUT_OF_RANGE, 1, 12, "70000");
    check_error(parse_fail("allow ssh\ndeny from 1.2.3.300\nblock\n"),
                ErrorKind::INVALID_IP_OCTET, 2, 17, "300");
    check_error(parse_fail("allow\nallow port 70000\n"),
                ErrorKind::SYNTAX, 1, 6);
    check_error(parse_fail("allow port 1\nallow port 70000\nallow port 80000"),
                ErrorKind::PORT_OUT_OF_RANGE, 2, 12, "70000");
}

static void test_output_untouched_on_error(void)
{
    std::vector<FirewallRule> rules = parse_ok("allow ssh\nallow http\n");
    ASSERT(rules.size() == 2, "Expected two rules.");

    std::optional<ParseError> err;

    err = parse_rules("allow ftp\nallow port 99999\n", &rules);
    ASSERT(err, "Invalid port should fail.");
    ASSERT(rules.size() == 2, "Rules were modified by validation error.");

    err = parse_rules("allow ftp\nallow\n", &rules);
    ASSERT(err, "Missing service should fail.");
    ASSERT(rules.size() == 2, "Rules were modified by syntax error.");
    ASSERT(std::get<ServiceRule>(rules[1]).service == "http",
           "Existing rules were changed.");
}

/* Columns are counted in bytes, tabs and UTF-8 sequences included. */
static void test_positions(void)
{
    check_error(parse_fail("\tallow port 99999"),
                ErrorKind::PORT_OUT_OF_RANGE, 1, 13, "99999");
    check_error(parse_fail("# \xc3\xa4\xc3\xb6\nallow\tfrom\t999.0.0.1"),
                ErrorKind::INVALID_IP_OCTET, 2, 12, "999");

    ParseError err = parse_fail("\n\n\nallow in on");
    ASSERT(err.line == 4, "Error should be on line 4.");
    ASSERT(err.offset <= std::string("\n\n\nallow in on").size(),
           "Error offset is outside of the input.");
}

static void test_large_input(void)
{
    std::string input;
    for (size_t i = 0; i < 20000; ++i) {
        input += "allow in on eth0 from 10.0.0.1 to any port 443 proto tcp\n";
        if (i % 3 == 0)
            input += "\n# comment\n";
    }

    std::vector<FirewallRule> rules = parse_ok(input);
    ASSERT(rules.size() == 20000, "Expected 20000 rules but got "
           + std::to_string(rules.size()) + ".");

    input += "deny to 10.0.0.300\n";
    size_t lines = std::count(input.begin(), input.end(), '\n');
    ParseError err = parse_fail(input);
    check_error(err, ErrorKind::INVALID_IP_OCTET, lines, 16, "300");
}

/* Rule lines are logged with their line number, counting blank lines. */
static void test_trace_line_numbers(void)
{
    std::ostringstream captured;
    std::streambuf *orig = std::cerr.rdbuf(captured.rdbuf());
    Verbosity old_verbosity = get_verbosity();
    set_verbosity(Verbosity::TRACE);

    std::vector<FirewallRule> rules;
    std::optional<ParseError> err =
        parse_rules("\n# c\n  allow ssh\r\n\nallow port 22 # x\n", &rules);

    set_verbosity(old_verbosity);
    std::cerr.rdbuf(orig);

    ASSERT(!err, "Parsing should have succeeded.");
    std::string log = captured.str();
    ASSERT(log.find("Line 3: service rule for 'ssh'.") != std::string::npos,
           "Service rule should be logged for line 3: " + log);
    ASSERT(log.find("Line 5: address rule with 1 clause(s).")
           != std::string::npos,
           "Address rule should be logged for line 5: " + log);
}

int main(void)
{
    test_service_rule();
    test_address_rule();
    test_ip_literals();
    test_empty_inputs();
    test_rule_count();
    test_interface_names();
    test_duplicate_clauses();
    test_syntax_errors();
    test_validation_errors();
    test_first_error();
    test_output_untouched_on_error();
    test_positions();
    test_large_input();
    test_trace_line_numbers();
    return 0;
}
