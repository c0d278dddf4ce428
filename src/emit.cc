// SPDX-License-Identifier: LGPL-3.0-only
#include "emit.hh"

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "logging.hh"
#include "serial.hh"

YAML::Emitter &operator<<(YAML::Emitter &out, const IpSpec &ip)
{
    out << YAML::BeginMap
        << YAML::Key << "kind" << YAML::Value << "ip"
        << YAML::Key << "family" << YAML::Value
        << (ip.family == IpSpec::Family::INET6 ? "ipv6" : "ipv4")
        << YAML::Key << "address" << YAML::Value << ip.address;

    if (ip.prefix) {
        out << YAML::Key << "prefix" << YAML::Value
            << static_cast<unsigned int>(ip.prefix.value());
    }

    return out << YAML::EndMap;
}

YAML::Emitter &operator<<(YAML::Emitter &out, const Addr &addr)
{
    if (const AddrKeyword *kw = std::get_if<AddrKeyword>(&addr)) {
        return out << YAML::BeginMap
                   << YAML::Key << "kind" << YAML::Value << keyword(*kw)
                   << YAML::EndMap;
    }

    return out << std::get<IpSpec>(addr);
}

YAML::Emitter &operator<<(YAML::Emitter &out, const Clause &clause)
{
    out << YAML::BeginMap;

    if (const FromClause *from = std::get_if<FromClause>(&clause)) {
        out << YAML::Key << "kind" << YAML::Value << "from"
            << YAML::Key << "addr" << YAML::Value << from->addr;
    } else if (const ToClause *to = std::get_if<ToClause>(&clause)) {
        out << YAML::Key << "kind" << YAML::Value << "to"
            << YAML::Key << "addr" << YAML::Value << to->addr;
    } else if (const PortClause *port = std::get_if<PortClause>(&clause)) {
        out << YAML::Key << "kind" << YAML::Value << "port"
            << YAML::Key << "port" << YAML::Value
            << static_cast<unsigned int>(port->port);
    } else if (const ProtoClause *proto = std::get_if<ProtoClause>(&clause)) {
        out << YAML::Key << "kind" << YAML::Value << "proto"
            << YAML::Key << "proto" << YAML::Value << keyword(proto->proto);
    }

    return out << YAML::EndMap;
}

YAML::Emitter &operator<<(YAML::Emitter &out, const FirewallRule &rule)
{
    out << YAML::BeginMap;

    if (const ServiceRule *svc = std::get_if<ServiceRule>(&rule)) {
        out << YAML::Key << "kind" << YAML::Value << "service"
            << YAML::Key << "action" << YAML::Value << keyword(svc->action)
            << YAML::Key << "service" << YAML::Value << svc->service;
        return out << YAML::EndMap;
    }

    const AddressRule &addr = std::get<AddressRule>(rule);

    out << YAML::Key << "kind" << YAML::Value << "address"
        << YAML::Key << "action" << YAML::Value << keyword(addr.action);

    if (addr.direction) {
        out << YAML::Key << "direction" << YAML::Value
            << keyword(addr.direction.value());
    }

    if (addr.interface) {
        out << YAML::Key << "interface" << YAML::Value
            << addr.interface.value();
    }

    out << YAML::Key << "clauses" << YAML::Value << YAML::BeginSeq;
    for (const Clause &clause : addr.clauses)
        out << clause;
    out << YAML::EndSeq;

    return out << YAML::EndMap;
}

static std::string emit_rules(YAML::Emitter &out,
                              const std::vector<FirewallRule> &rules)
{
    out << YAML::BeginSeq;
    for (const FirewallRule &rule : rules)
        out << rule;
    out << YAML::EndSeq;

    if (!out.good()) {
        LOG(ERROR) << "Unable to emit rules: " << out.GetLastError();
        throw std::runtime_error("Unable to emit rules: "
                                 + out.GetLastError());
    }

    return std::string(out.c_str()) + '\n';
}

std::string rules_to_yaml(const std::vector<FirewallRule> &rules)
{
    YAML::Emitter out;
    return emit_rules(out, rules);
}

std::string rules_to_json(const std::vector<FirewallRule> &rules)
{
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    return emit_rules(out, rules);
}
