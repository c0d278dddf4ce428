// SPDX-License-Identifier: LGPL-3.0-only
#include "serial.hh"

#include "rules.hh"
#include "types.hh"

const char *keyword(Action action)
{
    switch (action) {
        case Action::ALLOW:  return "allow";
        case Action::DENY:   return "deny";
        case Action::REJECT: return "reject";
        case Action::LIMIT:  return "limit";
    }
    return "";
}

const char *keyword(RuleDir dir)
{
    switch (dir) {
        case RuleDir::INCOMING: return "in";
        case RuleDir::OUTGOING: return "out";
    }
    return "";
}

const char *keyword(Protocol proto)
{
    switch (proto) {
        case Protocol::TCP: return "tcp";
        case Protocol::UDP: return "udp";
        case Protocol::ANY: return "any";
    }
    return "";
}

const char *keyword(AddrKeyword addr)
{
    switch (addr) {
        case AddrKeyword::ANY:      return "any";
        case AddrKeyword::INTERNAL: return "internal";
        case AddrKeyword::EXTERNAL: return "external";
    }
    return "";
}

void serialise(const Action &action, std::ostream &out)
{
    out << keyword(action);
}

void serialise(const RuleDir &dir, std::ostream &out)
{
    out << keyword(dir);
}

void serialise(const Protocol &proto, std::ostream &out)
{
    out << keyword(proto);
}

void serialise(const AddrKeyword &addr, std::ostream &out)
{
    out << keyword(addr);
}

void serialise(const IpSpec &ip, std::ostream &out)
{
    out << ip.address;
    if (ip.prefix)
        out << '/' << static_cast<unsigned int>(ip.prefix.value());
}

void serialise(const FromClause &clause, std::ostream &out)
{
    out << "from ";
    serialise(clause.addr, out);
}

void serialise(const ToClause &clause, std::ostream &out)
{
    out << "to ";
    serialise(clause.addr, out);
}

void serialise(const PortClause &clause, std::ostream &out)
{
    out << "port " << clause.port;
}

void serialise(const ProtoClause &clause, std::ostream &out)
{
    out << "proto ";
    serialise(clause.proto, out);
}

void serialise(const ServiceRule &rule, std::ostream &out)
{
    serialise(rule.action, out);
    out << ' ' << rule.service;
}

void serialise(const AddressRule &rule, std::ostream &out)
{
    serialise(rule.action, out);

    if (rule.direction) {
        out.put(' ');
        serialise(rule.direction.value(), out);
    }

    if (rule.interface)
        out << " on " << rule.interface.value();

    for (const Clause &clause : rule.clauses) {
        out.put(' ');
        serialise(clause, out);
    }
}
