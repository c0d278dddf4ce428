// SPDX-License-Identifier: LGPL-3.0-only
#ifndef UFWPARSE_TYPES_HH
#define UFWPARSE_TYPES_HH

#include <optional>
#include <string>

enum class Action { ALLOW, DENY, REJECT, LIMIT };

enum class RuleDir { INCOMING, OUTGOING };

enum class Protocol { TCP, UDP, ANY };

/* Symbolic addresses, resolved by whoever applies the rules. */
enum class AddrKeyword { ANY, INTERNAL, EXTERNAL };

using MaybeError = std::optional<std::string>;

#endif
