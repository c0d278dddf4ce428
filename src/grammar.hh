// SPDX-License-Identifier: LGPL-3.0-only
#ifndef UFWPARSE_GRAMMAR_HH
#define UFWPARSE_GRAMMAR_HH

#include "types.hh"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/* Every rule name a grammar may define. Rules in the grammar text are looked
 * up by their name in this enum, so the parse tree can only ever contain
 * nodes that the AST builder knows about.
 *
 * NOTE: If you change anything here, be sure to sync it with the symbol
 *       table in grammar.cc.
 */
enum class Symbol {
    FILE,
    LINE,
    SERVICE_RULE,
    ADDR_RULE,
    ACTION,
    DIRECTION,
    INTERFACE_CLAUSE,
    CLAUSE,
    FROM_CLAUSE,
    TO_CLAUSE,
    PORT_CLAUSE,
    PROTO_CLAUSE,
    ADDR,
    ADDR_KEYWORD,
    IP,
    IPV4,
    IPV6,
    PREFIX,
    PORT_NUMBER,
    PROTO,
    IDENT,
    COMMENT,
    KEYWORD,
    LINE_END,
    WORD_CHAR,
    WS,
    NEWLINE,
    EOI
};

const char *symbol_name(Symbol);
std::string describe_symbol(Symbol);

struct ParseNode {
    Symbol symbol;
    size_t start;
    size_t end;
    std::string text;
    std::vector<ParseNode> children;

    const ParseNode *find(Symbol) const;
};

struct SyntaxFailure {
    size_t offset;
    std::vector<std::string> expected;
};

struct Expr {
    enum class Op {
        LITERAL, CLASS, RULE, EOI,
        SEQUENCE, CHOICE, OPTIONAL, STAR, PLUS, AND, NOT
    };

    Op op = Op::SEQUENCE;
    std::string text;
    std::vector<std::pair<char, char>> ranges;
    bool negated = false;
    Symbol rule = Symbol::EOI;
    std::vector<Expr> items;

    bool class_matches(char) const;
};

struct RuleDef {
    bool defined = false;
    bool atomic = false;
    bool silent = false;
    Expr body;
};

class Grammar
{
    std::vector<RuleDef> rules;

    public:
        Grammar();

        static MaybeError load(const std::string&, Grammar*);

        std::optional<SyntaxFailure> match(Symbol, const std::string&,
                                           ParseNode*) const;

        inline const RuleDef &rule(Symbol sym) const {
            return this->rules[static_cast<size_t>(sym)];
        }

    private:
        friend class GrammarLoader;
};

/* The firewall rule grammar, loaded from the grammar text embedded at build
 * time. Throws std::logic_error if the embedded grammar is broken.
 */
const Grammar &firewall_grammar(void);

std::optional<SyntaxFailure> match_grammar(Symbol, const std::string&,
                                           ParseNode*);

#endif
