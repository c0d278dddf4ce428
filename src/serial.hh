// SPDX-License-Identifier: LGPL-3.0-only
#ifndef UFWPARSE_SERIAL_HH
#define UFWPARSE_SERIAL_HH

#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "rules.hh"
#include "types.hh"

/* Keywords as they are written in rule files. */
const char *keyword(Action);
const char *keyword(RuleDir);
const char *keyword(Protocol);
const char *keyword(AddrKeyword);

/* Serialisation into canonical rule text, which parse_rules() turns back
 * into the same rules.
 */
void serialise(const Action&, std::ostream&);
void serialise(const RuleDir&, std::ostream&);
void serialise(const Protocol&, std::ostream&);
void serialise(const AddrKeyword&, std::ostream&);
void serialise(const IpSpec&, std::ostream&);

void serialise(const FromClause&, std::ostream&);
void serialise(const ToClause&, std::ostream&);
void serialise(const PortClause&, std::ostream&);
void serialise(const ProtoClause&, std::ostream&);

void serialise(const ServiceRule&, std::ostream&);
void serialise(const AddressRule&, std::ostream&);

template <typename... Ts>
void serialise(const std::variant<Ts...> &val, std::ostream &out)
{
    std::visit([&out](const auto &alt) { serialise(alt, out); }, val);
}

/* One rule per line. */
template <typename T>
void serialise(const std::vector<T> &val, std::ostream &out)
{
    for (const T &item : val) {
        serialise(item, out);
        out.put('\n');
    }
}

/* A std::string convenience wrapper. */
template <typename T>
std::string serialise(const T &val)
{
    std::ostringstream out;
    serialise(val, out);
    return out.str();
}

#endif
