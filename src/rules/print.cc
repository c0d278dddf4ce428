// SPDX-License-Identifier: LGPL-3.0-only
#include "../rules.hh"
#include "serial.hh"
#include "types.hh"

#include <iostream>
#include <string>
#include <variant>
#include <vector>

static std::string describe_addr(const Addr &addr)
{
    if (const AddrKeyword *kw = std::get_if<AddrKeyword>(&addr)) {
        switch (*kw) {
            case AddrKeyword::ANY:      return "<any>";
            case AddrKeyword::INTERNAL: return "<internal>";
            case AddrKeyword::EXTERNAL: return "<external>";
        }
    }

    const IpSpec &ip = std::get<IpSpec>(addr);
    std::string family = ip.family == IpSpec::Family::INET6 ? "IPv6" : "IPv4";
    return serialise(ip) + " (" + family + ")";
}

static void print_clause(const Clause &clause, std::ostream &out)
{
    if (const FromClause *from = std::get_if<FromClause>(&clause)) {
        out << "  From: " << describe_addr(from->addr) << std::endl;
    } else if (const ToClause *to = std::get_if<ToClause>(&clause)) {
        out << "  To: " << describe_addr(to->addr) << std::endl;
    } else if (const PortClause *port = std::get_if<PortClause>(&clause)) {
        out << "  Port: " << port->port << std::endl;
    } else if (const ProtoClause *proto = std::get_if<ProtoClause>(&clause)) {
        std::string protostr;
        if (proto->proto == Protocol::TCP)
            protostr = "TCP";
        else if (proto->proto == Protocol::UDP)
            protostr = "UDP";
        else
            protostr = "TCP and UDP";
        out << "  Protocol: " << protostr << std::endl;
    }
}

void print_rules(const std::vector<FirewallRule> &rules, std::ostream &out)
{
    int pos = 0;
    for (const FirewallRule &rule : rules) {
        out << "Rule #" << ++pos << ':' << std::endl;

        if (const ServiceRule *svc = std::get_if<ServiceRule>(&rule)) {
            out << "  Action: " << keyword(svc->action) << std::endl
                << "  Service: " << svc->service << std::endl;
            continue;
        }

        const AddressRule &addr = std::get<AddressRule>(rule);

        std::string dirstr;
        if (addr.direction == RuleDir::INCOMING)
            dirstr = "incoming";
        else if (addr.direction == RuleDir::OUTGOING)
            dirstr = "outgoing";
        else
            dirstr = "both";

        out << "  Action: " << keyword(addr.action) << std::endl
            << "  Direction: " << dirstr << std::endl
            << "  Interface: " << addr.interface.value_or("<any>")
            << std::endl;

        for (const Clause &clause : addr.clauses)
            print_clause(clause, out);
    }
}
