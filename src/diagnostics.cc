// SPDX-License-Identifier: LGPL-3.0-only
#include "diagnostics.hh"
#include "grammar.hh"

#include <algorithm>
#include <string>
#include <vector>

SourcePos locate(const std::string &text, size_t offset)
{
    offset = std::min(offset, text.size());

    size_t line = 1 + std::count(text.begin(), text.begin() + offset, '\n');
    size_t line_start = text.rfind('\n', offset == 0 ? 0 : offset - 1);

    if (line_start == std::string::npos || line_start >= offset)
        line_start = 0;
    else
        line_start += 1;

    return SourcePos{line, offset - line_start + 1};
}

const char *describe_error_kind(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::SYNTAX:              return "syntax error";
        case ErrorKind::PORT_OUT_OF_RANGE:   return "port out of range";
        case ErrorKind::INVALID_IP_OCTET:    return "invalid IPv4 octet";
        case ErrorKind::INVALID_IP_ADDRESS:  return "invalid IP address";
        case ErrorKind::INVALID_CIDR_PREFIX: return "invalid CIDR prefix";
    }
    return "unknown error";
}

/* Whitespace and end of input are almost always among the alternatives, so
 * only mention them if there is nothing better to say.
 */
static std::vector<std::string>
    summarise_expected(const std::vector<std::string> &expected)
{
    const std::string eol = describe_symbol(Symbol::NEWLINE);
    const std::string eoi = describe_symbol(Symbol::EOI);
    const std::string ws = describe_symbol(Symbol::WS);

    bool has_eol = std::find(expected.begin(), expected.end(), eol)
                != expected.end();

    std::vector<std::string> result;
    for (const std::string &label : expected) {
        if (label == eoi && has_eol)
            continue;
        if (label == ws && expected.size() > 1)
            continue;
        result.push_back(label);
    }

    return result.empty() ? expected : result;
}

static std::string join_expected(const std::vector<std::string> &labels)
{
    if (labels.empty())
        return "nothing";
    if (labels.size() == 1)
        return labels.front();
    if (labels.size() == 2)
        return labels[0] + " or " + labels[1];

    std::string result = "one of ";
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0)
            result += ", ";
        result += labels[i];
    }
    return result;
}

static std::string describe_found(const std::string &text, size_t offset)
{
    if (offset >= text.size())
        return "end of input";

    if (text[offset] == '\n' || text[offset] == '\r')
        return "end of line";

    size_t end = text.find_first_of(" \t\r\n", offset);
    if (end == offset)
        return "whitespace";
    if (end == std::string::npos)
        end = text.size();

    return '"' + text.substr(offset, end - offset) + '"';
}

ParseError syntax_error(const std::string &text, const SyntaxFailure &fail)
{
    SourcePos pos = locate(text, fail.offset);
    std::vector<std::string> expected = summarise_expected(fail.expected);

    std::string msg = "expected " + join_expected(expected)
                    + " but found " + describe_found(text, fail.offset);

    return ParseError{ErrorKind::SYNTAX, fail.offset, pos.line, pos.column,
                      msg, expected, ""};
}

ParseError validation_error(const std::string &text, size_t offset,
                            ErrorKind kind, const std::string &literal,
                            const std::string &msg)
{
    SourcePos pos = locate(text, offset);
    return ParseError{kind, offset, pos.line, pos.column, msg, {}, literal};
}

void print_error(const ParseError &err, const std::string &text,
                 const std::string &file, std::ostream &out)
{
    size_t offset = std::min(err.offset, text.size());
    size_t line_start = offset - (err.column - 1);
    size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos)
        line_end = text.size();

    std::string source = text.substr(line_start, line_end - line_start);
    if (!source.empty() && source.back() == '\r')
        source.pop_back();

    /* Keep tabs so that the marker lines up with the source line. */
    std::string indent;
    for (size_t i = 0; i < err.column - 1 && i < source.size(); ++i)
        indent += source[i] == '\t' ? '\t' : ' ';

    size_t len = std::max(err.literal.size(), static_cast<size_t>(1));

    out << file << ':' << err.line << ':' << err.column << ": "
        << describe_error_kind(err.kind) << ": " << err.message << std::endl
        << "    " << source << std::endl
        << "    " << indent << std::string(len, '^') << std::endl;
}
