// SPDX-License-Identifier: LGPL-3.0-only
#ifndef UFWPARSE_EMIT_HH
#define UFWPARSE_EMIT_HH

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "rules.hh"

YAML::Emitter &operator<<(YAML::Emitter&, const IpSpec&);
YAML::Emitter &operator<<(YAML::Emitter&, const Addr&);
YAML::Emitter &operator<<(YAML::Emitter&, const Clause&);
YAML::Emitter &operator<<(YAML::Emitter&, const FirewallRule&);

std::string rules_to_yaml(const std::vector<FirewallRule>&);

/* JSON is emitted by yaml-cpp as well, using flow style and double-quoted
 * strings only, which results in a valid JSON document.
 */
std::string rules_to_json(const std::vector<FirewallRule>&);

#endif
