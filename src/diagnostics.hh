// SPDX-License-Identifier: LGPL-3.0-only
#ifndef UFWPARSE_DIAGNOSTICS_HH
#define UFWPARSE_DIAGNOSTICS_HH

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

struct SyntaxFailure;

enum class ErrorKind {
    SYNTAX,
    PORT_OUT_OF_RANGE,
    INVALID_IP_OCTET,
    INVALID_IP_ADDRESS,
    INVALID_CIDR_PREFIX
};

struct SourcePos {
    size_t line;
    size_t column;
};

struct ParseError {
    ErrorKind kind;
    size_t offset;
    size_t line;
    size_t column;
    std::string message;

    /* Only set for syntax errors. */
    std::vector<std::string> expected;

    /* The offending text of a validation error. */
    std::string literal;

    inline bool is_syntax_error(void) const {
        return this->kind == ErrorKind::SYNTAX;
    }
};

SourcePos locate(const std::string&, size_t);
const char *describe_error_kind(ErrorKind);

ParseError syntax_error(const std::string&, const SyntaxFailure&);
ParseError validation_error(const std::string&, size_t, ErrorKind,
                            const std::string&, const std::string&);

void print_error(const ParseError&, const std::string&, const std::string&,
                 std::ostream&);

#endif
