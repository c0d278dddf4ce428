// SPDX-License-Identifier: LGPL-3.0-only
#include "../rules.hh"
#include "diagnostics.hh"
#include "grammar.hh"
#include "logging.hh"
#include "types.hh"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <ctype.h>
#include <netinet/in.h>
#include <stdint.h>

using MaybeParseError = std::optional<ParseError>;

static std::logic_error unexpected_node(const ParseNode &node,
                                        const char *context)
{
    return std::logic_error(std::string("Unexpected ")
                            + symbol_name(node.symbol) + " node in "
                            + context + ".");
}

/* Convert a string into a port number, checking whether it satisfies bounds of
 * an uint16_t. Leading zeros are stripped first, so that we can check whether
 * the length is short enough before converting to uint32_t and checking the
 * upper bound.
 */
static std::optional<uint16_t> string2port(const std::string &str)
{
    std::string value(str);
    value.erase(0, str.find_first_not_of('0'));

    if (!str.empty() && value.empty())
        return 0;

    if (value.empty() || value.length() > 5)
        return std::nullopt;

    if (std::all_of(value.begin(), value.end(), isdigit)) {
        uint32_t intval = std::stoul(value);

        if (intval <= 65535)
            return static_cast<uint16_t>(intval);

        return std::nullopt;
    }

    return std::nullopt;
}

static Action to_action(const ParseNode &node)
{
    if (node.text == "allow")
        return Action::ALLOW;
    else if (node.text == "deny")
        return Action::DENY;
    else if (node.text == "reject")
        return Action::REJECT;
    else if (node.text == "limit")
        return Action::LIMIT;

    throw std::logic_error("Unknown action \"" + node.text + "\".");
}

static RuleDir to_direction(const ParseNode &node)
{
    if (node.text == "in")
        return RuleDir::INCOMING;
    else if (node.text == "out")
        return RuleDir::OUTGOING;

    throw std::logic_error("Unknown direction \"" + node.text + "\".");
}

static Protocol to_protocol(const ParseNode &node)
{
    if (node.text == "tcp")
        return Protocol::TCP;
    else if (node.text == "udp")
        return Protocol::UDP;
    else if (node.text == "any")
        return Protocol::ANY;

    throw std::logic_error("Unknown protocol \"" + node.text + "\".");
}

static AddrKeyword to_addr_keyword(const ParseNode &node)
{
    if (node.text == "any")
        return AddrKeyword::ANY;
    else if (node.text == "internal")
        return AddrKeyword::INTERNAL;
    else if (node.text == "external")
        return AddrKeyword::EXTERNAL;

    throw std::logic_error("Unknown address keyword \"" + node.text + "\".");
}

static const ParseNode &child(const ParseNode &node, Symbol sym)
{
    const ParseNode *found = node.find(sym);
    if (found == nullptr) {
        throw std::logic_error(std::string("Missing ") + symbol_name(sym)
                               + " node in " + symbol_name(node.symbol)
                               + ".");
    }
    return *found;
}

static MaybeParseError validate_ipv4(const std::string &text,
                                     const ParseNode &node)
{
    size_t pos = 0;

    while (pos <= node.text.size()) {
        size_t dot = node.text.find('.', pos);
        if (dot == std::string::npos)
            dot = node.text.size();

        std::string octet = node.text.substr(pos, dot - pos);
        std::string value(octet);
        value.erase(0, std::min(value.find_first_not_of('0'),
                                value.size() - 1));

        if (value.length() > 3 || std::stoul(value) > 255) {
            return validation_error(
                text, node.start + pos, ErrorKind::INVALID_IP_OCTET, octet,
                "octet \"" + octet + "\" of IPv4 address \"" + node.text
                + "\" is not in range 0..255"
            );
        }

        pos = dot + 1;
    }

    return std::nullopt;
}

static MaybeParseError validate_ipv6(const std::string &text,
                                     const ParseNode &node)
{
    struct in6_addr buf;

    if (inet_pton(AF_INET6, node.text.c_str(), &buf) != 1) {
        return validation_error(
            text, node.start, ErrorKind::INVALID_IP_ADDRESS, node.text,
            "\"" + node.text + "\" is not a valid IPv6 address"
        );
    }

    return std::nullopt;
}

static MaybeParseError build_ip(const std::string &text,
                                const ParseNode &node, IpSpec *out)
{
    MaybeParseError err;
    const ParseNode *addr;
    unsigned long max_prefix;

    if ((addr = node.find(Symbol::IPV4)) != nullptr) {
        if ((err = validate_ipv4(text, *addr)))
            return err;
        out->family = IpSpec::Family::INET;
        max_prefix = 32;
    } else if ((addr = node.find(Symbol::IPV6)) != nullptr) {
        if ((err = validate_ipv6(text, *addr)))
            return err;
        out->family = IpSpec::Family::INET6;
        max_prefix = 128;
    } else {
        throw unexpected_node(node, "ip");
    }

    out->address = addr->text;
    out->prefix = std::nullopt;

    const ParseNode *prefix = node.find(Symbol::PREFIX);
    if (prefix != nullptr) {
        std::string value(prefix->text);
        value.erase(0, std::min(value.find_first_not_of('0'),
                                value.size() - 1));

        if (value.length() > 3 || std::stoul(value) > max_prefix) {
            return validation_error(
                text, prefix->start, ErrorKind::INVALID_CIDR_PREFIX,
                prefix->text,
                "prefix length \"" + prefix->text + "\" is not in range 0.."
                + std::to_string(max_prefix) + " for "
                + (max_prefix == 32 ? "IPv4" : "IPv6") + " address \""
                + addr->text + "\""
            );
        }

        out->prefix = static_cast<uint8_t>(std::stoul(value));
    }

    return std::nullopt;
}

static MaybeParseError build_addr(const std::string &text,
                                  const ParseNode &node, Addr *out)
{
    const ParseNode &inner = node.children.at(0);

    if (inner.symbol == Symbol::ADDR_KEYWORD) {
        *out = to_addr_keyword(inner);
        return std::nullopt;
    }

    if (inner.symbol != Symbol::IP)
        throw unexpected_node(inner, "addr");

    MaybeParseError err;
    IpSpec ip;
    if ((err = build_ip(text, inner, &ip)))
        return err;

    *out = ip;
    return std::nullopt;
}

static MaybeParseError build_clause(const std::string &text,
                                    const ParseNode &node, Clause *out)
{
    MaybeParseError err;
    const ParseNode &inner = node.children.at(0);

    switch (inner.symbol) {
        case Symbol::FROM_CLAUSE: {
            FromClause clause;
            if ((err = build_addr(text, child(inner, Symbol::ADDR),
                                  &clause.addr)))
                return err;
            *out = clause;
            return std::nullopt;
        }
        case Symbol::TO_CLAUSE: {
            ToClause clause;
            if ((err = build_addr(text, child(inner, Symbol::ADDR),
                                  &clause.addr)))
                return err;
            *out = clause;
            return std::nullopt;
        }
        case Symbol::PORT_CLAUSE: {
            const ParseNode &number = child(inner, Symbol::PORT_NUMBER);
            std::optional<uint16_t> port = string2port(number.text);
            if (!port) {
                return validation_error(
                    text, number.start, ErrorKind::PORT_OUT_OF_RANGE,
                    number.text,
                    "port number \"" + number.text + "\" is not in range"
                    " 0..65535"
                );
            }
            *out = PortClause{port.value()};
            return std::nullopt;
        }
        case Symbol::PROTO_CLAUSE:
            *out = ProtoClause{to_protocol(child(inner, Symbol::PROTO))};
            return std::nullopt;
        case Symbol::FILE:
        case Symbol::LINE:
        case Symbol::SERVICE_RULE:
        case Symbol::ADDR_RULE:
        case Symbol::ACTION:
        case Symbol::DIRECTION:
        case Symbol::INTERFACE_CLAUSE:
        case Symbol::CLAUSE:
        case Symbol::ADDR:
        case Symbol::ADDR_KEYWORD:
        case Symbol::IP:
        case Symbol::IPV4:
        case Symbol::IPV6:
        case Symbol::PREFIX:
        case Symbol::PORT_NUMBER:
        case Symbol::PROTO:
        case Symbol::IDENT:
        case Symbol::COMMENT:
        case Symbol::KEYWORD:
        case Symbol::LINE_END:
        case Symbol::WORD_CHAR:
        case Symbol::WS:
        case Symbol::NEWLINE:
        case Symbol::EOI:
            break;
    }

    throw unexpected_node(inner, "clause");
}

static ServiceRule build_service_rule(const ParseNode &node)
{
    ServiceRule rule;
    rule.action = to_action(child(node, Symbol::ACTION));
    rule.service = child(node, Symbol::IDENT).text;
    return rule;
}

static MaybeParseError build_address_rule(const std::string &text,
                                          const ParseNode &node,
                                          AddressRule *out)
{
    MaybeParseError err;
    AddressRule rule;

    for (const ParseNode &item : node.children) {
        switch (item.symbol) {
            case Symbol::ACTION:
                rule.action = to_action(item);
                break;
            case Symbol::DIRECTION:
                rule.direction = to_direction(item);
                break;
            case Symbol::INTERFACE_CLAUSE:
                rule.interface = child(item, Symbol::IDENT).text;
                break;
            case Symbol::CLAUSE: {
                Clause clause;
                if ((err = build_clause(text, item, &clause)))
                    return err;
                rule.clauses.push_back(clause);
                break;
            }
            default:
                throw unexpected_node(item, "addr_rule");
        }
    }

    if (rule.clauses.empty())
        throw std::logic_error("Address rule without any clauses.");

    *out = rule;
    return std::nullopt;
}

static MaybeParseError build_line(const std::string &text,
                                  const ParseNode &line, size_t lineno,
                                  std::vector<FirewallRule> *out)
{
    MaybeParseError err;

    for (const ParseNode &item : line.children) {
        switch (item.symbol) {
            case Symbol::SERVICE_RULE:
                out->push_back(build_service_rule(item));
                LOG(TRACE) << "Line " << lineno
                           << ": service rule for '"
                           << std::get<ServiceRule>(out->back()).service
                           << "'.";
                break;
            case Symbol::ADDR_RULE: {
                AddressRule rule;
                if ((err = build_address_rule(text, item, &rule)))
                    return err;
                LOG(TRACE) << "Line " << lineno
                           << ": address rule with " << rule.clauses.size()
                           << " clause(s).";
                out->push_back(rule);
                break;
            }
            case Symbol::COMMENT:
                break;
            default:
                throw unexpected_node(item, "line");
        }
    }

    return std::nullopt;
}

static MaybeParseError build_rules(const std::string &text,
                                   const ParseNode &file,
                                   std::vector<FirewallRule> *out)
{
    MaybeParseError err;
    size_t lineno = 1;
    size_t counted = 0;

    /* Blank lines have no node, so newlines are counted up to each line. */
    for (const ParseNode &line : file.children) {
        if (line.symbol != Symbol::LINE)
            throw unexpected_node(line, "file");

        lineno += std::count(text.begin() + counted,
                             text.begin() + line.start, '\n');
        counted = line.start;

        if ((err = build_line(text, line, lineno, out)))
            return err;
    }

    return std::nullopt;
}

std::optional<ParseError> parse_rules(const std::string &text,
                                      std::vector<FirewallRule> *out)
{
    TRACE_CALL("parse_rules", "<" + std::to_string(text.size()) + " bytes>",
               out);

    ParseNode tree;
    std::optional<SyntaxFailure> failure =
        match_grammar(Symbol::FILE, text, &tree);

    if (failure) {
        ParseError err = syntax_error(text, *failure);
        LOG(DEBUG) << "Syntax error at line " << err.line << ", column "
                   << err.column << ": " << err.message;

        /* The lines before the failing one are well-formed, so an invalid
         * literal in there comes first and has to be reported instead.
         */
        size_t line_start = err.offset - (err.column - 1);
        if (line_start > 0) {
            std::string head = text.substr(0, line_start);
            ParseNode head_tree;
            if (!match_grammar(Symbol::FILE, head, &head_tree)) {
                std::vector<FirewallRule> discarded;
                MaybeParseError head_err =
                    build_rules(head, head_tree, &discarded);
                if (head_err)
                    return head_err;
            }
        }

        return err;
    }

    std::vector<FirewallRule> result;
    MaybeParseError err;
    if ((err = build_rules(text, tree, &result))) {
        LOG(DEBUG) << "Invalid literal at line " << err->line << ", column "
                   << err->column << ": " << err->message;
        return err;
    }

    LOG(DEBUG) << "Parsed " << result.size() << " rule(s) from "
               << tree.children.size() << " non-blank line(s).";

    *out = std::move(result);
    return std::nullopt;
}
