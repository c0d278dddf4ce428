// SPDX-License-Identifier: LGPL-3.0-only
#ifndef UFWPARSE_RULES_HH
#define UFWPARSE_RULES_HH

#include "diagnostics.hh"
#include "types.hh"

#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <stdint.h>

struct IpSpec {
    enum class Family { INET, INET6 };

    inline IpSpec() : family(Family::INET), address(), prefix(std::nullopt) {}
    inline IpSpec(Family f, const std::string &a,
                  std::optional<uint8_t> p = std::nullopt)
        : family(f), address(a), prefix(p) {}

    inline bool operator==(const IpSpec &other) const {
        return this->family == other.family
            && this->address == other.address
            && this->prefix == other.prefix;
    }

    inline bool operator!=(const IpSpec &other) const {
        return !(*this == other);
    }

    Family family;
    std::string address;
    std::optional<uint8_t> prefix;
};

using Addr = std::variant<AddrKeyword, IpSpec>;

struct FromClause {
    Addr addr;

    inline bool operator==(const FromClause &other) const {
        return this->addr == other.addr;
    }
};

struct ToClause {
    Addr addr;

    inline bool operator==(const ToClause &other) const {
        return this->addr == other.addr;
    }
};

struct PortClause {
    uint16_t port;

    inline bool operator==(const PortClause &other) const {
        return this->port == other.port;
    }
};

struct ProtoClause {
    Protocol proto;

    inline bool operator==(const ProtoClause &other) const {
        return this->proto == other.proto;
    }
};

using Clause = std::variant<FromClause, ToClause, PortClause, ProtoClause>;

struct ServiceRule {
    Action action = Action::ALLOW;
    std::string service;

    inline bool operator==(const ServiceRule &other) const {
        return this->action == other.action
            && this->service == other.service;
    }
};

/* Clauses are kept in source order. Repeated clause kinds are retained as
 * they were written, it's up to the consumer to decide what they mean.
 */
struct AddressRule {
    Action action = Action::ALLOW;
    std::optional<RuleDir> direction = std::nullopt;
    std::optional<std::string> interface = std::nullopt;
    std::vector<Clause> clauses;

    inline bool operator==(const AddressRule &other) const {
        return this->action == other.action
            && this->direction == other.direction
            && this->interface == other.interface
            && this->clauses == other.clauses;
    }
};

using FirewallRule = std::variant<ServiceRule, AddressRule>;

std::optional<ParseError> parse_rules(const std::string&,
                                      std::vector<FirewallRule>*);
void print_rules(const std::vector<FirewallRule>&, std::ostream&);

#endif
