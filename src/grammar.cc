// SPDX-License-Identifier: LGPL-3.0-only
#include "grammar.hh"
#include "grammar_text.hh"
#include "logging.hh"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct SymbolInfo {
    Symbol symbol;
    const char *name;
    const char *label;
};

/* NOTE: This needs to be in the same order as the Symbol enum. */
static const SymbolInfo symbol_table[] = {
    {Symbol::FILE,             "file",             "rule file"},
    {Symbol::LINE,             "line",             "rule or comment"},
    {Symbol::SERVICE_RULE,     "service_rule",     "service rule"},
    {Symbol::ADDR_RULE,        "addr_rule",        "address rule"},
    {Symbol::ACTION,           "action",           "action"},
    {Symbol::DIRECTION,        "direction",        "direction"},
    {Symbol::INTERFACE_CLAUSE, "interface_clause", "interface clause"},
    {Symbol::CLAUSE,           "clause",           "clause"},
    {Symbol::FROM_CLAUSE,      "from_clause",      "from clause"},
    {Symbol::TO_CLAUSE,        "to_clause",        "to clause"},
    {Symbol::PORT_CLAUSE,      "port_clause",      "port clause"},
    {Symbol::PROTO_CLAUSE,     "proto_clause",     "proto clause"},
    {Symbol::ADDR,             "addr",             "address"},
    {Symbol::ADDR_KEYWORD,     "addr_keyword",     "address keyword"},
    {Symbol::IP,               "ip",               "IP address"},
    {Symbol::IPV4,             "ipv4",             "IPv4 address"},
    {Symbol::IPV6,             "ipv6",             "IPv6 address"},
    {Symbol::PREFIX,           "prefix",           "prefix length"},
    {Symbol::PORT_NUMBER,      "port_number",      "port number"},
    {Symbol::PROTO,            "proto",            "protocol"},
    {Symbol::IDENT,            "ident",            "identifier"},
    {Symbol::COMMENT,          "comment",          "comment"},
    {Symbol::KEYWORD,          "KEYWORD",          "keyword"},
    {Symbol::LINE_END,         "LINE_END",         "end of line"},
    {Symbol::WORD_CHAR,        "WORD_CHAR",        "word character"},
    {Symbol::WS,               "WS",               "whitespace"},
    {Symbol::NEWLINE,          "NEWLINE",          "end of line"},
    {Symbol::EOI,              "EOI",              "end of input"},
};

static constexpr size_t symbol_count =
    sizeof(symbol_table) / sizeof(symbol_table[0]);

const char *symbol_name(Symbol sym)
{
    return symbol_table[static_cast<size_t>(sym)].name;
}

std::string describe_symbol(Symbol sym)
{
    return symbol_table[static_cast<size_t>(sym)].label;
}

static std::optional<Symbol> lookup_symbol(const std::string &name)
{
    for (const SymbolInfo &info : symbol_table) {
        if (name == info.name)
            return info.symbol;
    }
    return std::nullopt;
}

const ParseNode *ParseNode::find(Symbol sym) const
{
    for (const ParseNode &child : this->children) {
        if (child.symbol == sym)
            return &child;
    }
    return nullptr;
}

bool Expr::class_matches(char c) const
{
    bool found = std::any_of(
        this->ranges.begin(), this->ranges.end(),
        [c](const std::pair<char, char> &r) {
            return c >= r.first && c <= r.second;
        }
    );
    return found != this->negated;
}

/* Grammar text tokenizer and parser. */

struct Token {
    enum class Type {
        NAME, EQUALS, PIPE, LPAREN, RPAREN, STAR, PLUS, QUESTION,
        AND, NOT, AT, STRING, CLASS, END
    };

    Type type;
    std::string value;
    std::vector<std::pair<char, char>> ranges;
    bool negated;
    size_t line;
    size_t column;
};

static std::string describe_token(const Token &tok)
{
    switch (tok.type) {
        case Token::Type::NAME:     return "name '" + tok.value + "'";
        case Token::Type::EQUALS:   return "'='";
        case Token::Type::PIPE:     return "'|'";
        case Token::Type::LPAREN:   return "'('";
        case Token::Type::RPAREN:   return "')'";
        case Token::Type::STAR:     return "'*'";
        case Token::Type::PLUS:     return "'+'";
        case Token::Type::QUESTION: return "'?'";
        case Token::Type::AND:      return "'&'";
        case Token::Type::NOT:      return "'!'";
        case Token::Type::AT:       return "'@'";
        case Token::Type::STRING:   return "string \"" + tok.value + "\"";
        case Token::Type::CLASS:    return "character class " + tok.value;
        case Token::Type::END:      return "end of grammar";
    }
    return "unknown token";
}

static std::string grammar_error(size_t line, size_t column,
                                 const std::string &msg)
{
    return "line " + std::to_string(line) + ", column "
         + std::to_string(column) + ": " + msg;
}

class GrammarLexer
{
    const std::string &src;
    size_t pos;
    size_t line;
    size_t column;

    public:
        GrammarLexer(const std::string &s)
            : src(s), pos(0), line(1), column(1) {}

        MaybeError tokenize(std::vector<Token>*);

    private:
        inline char peek(size_t delta = 0) const {
            return this->pos + delta < this->src.size()
                 ? this->src[this->pos + delta] : '\0';
        }

        inline bool at_end(void) const {
            return this->pos >= this->src.size();
        }

        void consume(void);
        void skip_space(void);
        MaybeError read_escape(char*);
        MaybeError read_string(Token*);
        MaybeError read_class(Token*);
};

void GrammarLexer::consume(void)
{
    if (this->src[this->pos] == '\n') {
        ++this->line;
        this->column = 1;
    } else {
        ++this->column;
    }
    ++this->pos;
}

void GrammarLexer::skip_space(void)
{
    while (!this->at_end()) {
        char c = this->peek();
        if (c == '#') {
            while (!this->at_end() && this->peek() != '\n')
                this->consume();
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            this->consume();
        } else {
            break;
        }
    }
}

MaybeError GrammarLexer::read_escape(char *out)
{
    size_t l = this->line, c = this->column;

    this->consume();
    if (this->at_end())
        return grammar_error(l, c, "unterminated escape sequence");

    switch (this->peek()) {
        case 'n':  *out = '\n'; break;
        case 'r':  *out = '\r'; break;
        case 't':  *out = '\t'; break;
        case '\\': *out = '\\'; break;
        case '"':  *out = '"';  break;
        case ']':  *out = ']';  break;
        case '-':  *out = '-';  break;
        case '^':  *out = '^';  break;
        default:
            return grammar_error(l, c, std::string("unknown escape sequence"
                                                   " '\\") + this->peek()
                                                   + "'");
    }

    this->consume();
    return std::nullopt;
}

MaybeError GrammarLexer::read_string(Token *tok)
{
    MaybeError err;

    this->consume();
    for (;;) {
        if (this->at_end() || this->peek() == '\n')
            return grammar_error(tok->line, tok->column,
                                 "unterminated string literal");

        char c = this->peek();
        if (c == '"') {
            this->consume();
            break;
        }

        if (c == '\\') {
            if ((err = this->read_escape(&c)))
                return err;
        } else {
            this->consume();
        }
        tok->value += c;
    }

    if (tok->value.empty())
        return grammar_error(tok->line, tok->column, "empty string literal");

    return std::nullopt;
}

MaybeError GrammarLexer::read_class(Token *tok)
{
    MaybeError err;
    size_t start = this->pos;

    this->consume();
    if (this->peek() == '^') {
        tok->negated = true;
        this->consume();
    }

    for (;;) {
        if (this->at_end() || this->peek() == '\n')
            return grammar_error(tok->line, tok->column,
                                 "unterminated character class");

        char lo = this->peek();
        if (lo == ']') {
            this->consume();
            break;
        }

        if (lo == '\\') {
            if ((err = this->read_escape(&lo)))
                return err;
        } else {
            this->consume();
        }

        char hi = lo;
        if (this->peek() == '-' && this->peek(1) != ']') {
            this->consume();
            hi = this->peek();
            if (hi == '\\') {
                if ((err = this->read_escape(&hi)))
                    return err;
            } else {
                this->consume();
            }
            if (hi < lo) {
                return grammar_error(tok->line, tok->column,
                                     "invalid range in character class");
            }
        }
        tok->ranges.emplace_back(lo, hi);
    }

    if (tok->ranges.empty())
        return grammar_error(tok->line, tok->column,
                             "empty character class");

    tok->value = this->src.substr(start, this->pos - start);
    return std::nullopt;
}

MaybeError GrammarLexer::tokenize(std::vector<Token> *out)
{
    MaybeError err;

    for (;;) {
        this->skip_space();

        Token tok{Token::Type::END, "", {}, false, this->line, this->column};

        if (this->at_end()) {
            out->push_back(tok);
            return std::nullopt;
        }

        char c = this->peek();
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            tok.type = Token::Type::NAME;
            while (std::isalnum(static_cast<unsigned char>(this->peek()))
                   || this->peek() == '_') {
                tok.value += this->peek();
                this->consume();
            }
            out->push_back(tok);
            continue;
        }

        if (c == '"') {
            tok.type = Token::Type::STRING;
            if ((err = this->read_string(&tok)))
                return err;
            out->push_back(tok);
            continue;
        }

        if (c == '[') {
            tok.type = Token::Type::CLASS;
            if ((err = this->read_class(&tok)))
                return err;
            out->push_back(tok);
            continue;
        }

        switch (c) {
            case '=': tok.type = Token::Type::EQUALS;   break;
            case '|': tok.type = Token::Type::PIPE;     break;
            case '(': tok.type = Token::Type::LPAREN;   break;
            case ')': tok.type = Token::Type::RPAREN;   break;
            case '*': tok.type = Token::Type::STAR;     break;
            case '+': tok.type = Token::Type::PLUS;     break;
            case '?': tok.type = Token::Type::QUESTION; break;
            case '&': tok.type = Token::Type::AND;      break;
            case '!': tok.type = Token::Type::NOT;      break;
            case '@': tok.type = Token::Type::AT;       break;
            default:
                return grammar_error(tok.line, tok.column,
                                     std::string("unexpected character '")
                                     + c + "'");
        }
        this->consume();
        out->push_back(tok);
    }
}

class GrammarLoader
{
    const std::vector<Token> &tokens;
    size_t pos;
    Grammar *grammar;
    std::vector<std::pair<Symbol, const Token*>> references;

    public:
        GrammarLoader(const std::vector<Token> &t, Grammar *g)
            : tokens(t), pos(0), grammar(g), references() {}

        MaybeError load(void);

    private:
        inline const Token &peek(size_t delta = 0) const {
            size_t idx = std::min(this->pos + delta, this->tokens.size() - 1);
            return this->tokens[idx];
        }

        inline MaybeError unexpected(const std::string &what) const {
            const Token &tok = this->peek();
            return grammar_error(tok.line, tok.column, "expected " + what
                                 + " but got " + describe_token(tok));
        }

        bool at_sequence_end(void) const;
        MaybeError parse_rule(void);
        MaybeError parse_choice(Expr*);
        MaybeError parse_sequence(Expr*);
        MaybeError parse_prefixed(Expr*);
        MaybeError parse_suffixed(Expr*);
        MaybeError parse_primary(Expr*);
};

bool GrammarLoader::at_sequence_end(void) const
{
    switch (this->peek().type) {
        case Token::Type::PIPE:
        case Token::Type::RPAREN:
        case Token::Type::END:
        case Token::Type::AT:
            return true;
        case Token::Type::NAME:
            return this->peek(1).type == Token::Type::EQUALS;
        default:
            return false;
    }
}

MaybeError GrammarLoader::parse_primary(Expr *out)
{
    MaybeError err;
    const Token &tok = this->peek();

    switch (tok.type) {
        case Token::Type::NAME: {
            ++this->pos;
            if (tok.value == symbol_name(Symbol::EOI)) {
                out->op = Expr::Op::EOI;
                return std::nullopt;
            }
            std::optional<Symbol> sym = lookup_symbol(tok.value);
            if (!sym) {
                return grammar_error(tok.line, tok.column,
                                     "unknown rule '" + tok.value + "'");
            }
            out->op = Expr::Op::RULE;
            out->rule = *sym;
            this->references.emplace_back(*sym, &tok);
            return std::nullopt;
        }
        case Token::Type::STRING:
            ++this->pos;
            out->op = Expr::Op::LITERAL;
            out->text = tok.value;
            return std::nullopt;
        case Token::Type::CLASS:
            ++this->pos;
            out->op = Expr::Op::CLASS;
            out->text = tok.value;
            out->ranges = tok.ranges;
            out->negated = tok.negated;
            return std::nullopt;
        case Token::Type::LPAREN:
            ++this->pos;
            if ((err = this->parse_choice(out)))
                return err;
            if (this->peek().type != Token::Type::RPAREN)
                return this->unexpected("')'");
            ++this->pos;
            return std::nullopt;
        default:
            return this->unexpected("an expression");
    }
}

MaybeError GrammarLoader::parse_suffixed(Expr *out)
{
    MaybeError err;
    if ((err = this->parse_primary(out)))
        return err;

    for (;;) {
        Expr::Op op;
        switch (this->peek().type) {
            case Token::Type::STAR:     op = Expr::Op::STAR;     break;
            case Token::Type::PLUS:     op = Expr::Op::PLUS;     break;
            case Token::Type::QUESTION: op = Expr::Op::OPTIONAL; break;
            default:
                return std::nullopt;
        }
        ++this->pos;

        Expr wrapped;
        wrapped.op = op;
        wrapped.items.push_back(std::move(*out));
        *out = std::move(wrapped);
    }
}

MaybeError GrammarLoader::parse_prefixed(Expr *out)
{
    Expr::Op op;
    switch (this->peek().type) {
        case Token::Type::AND: op = Expr::Op::AND; break;
        case Token::Type::NOT: op = Expr::Op::NOT; break;
        default:
            return this->parse_suffixed(out);
    }
    ++this->pos;

    MaybeError err;
    Expr operand;
    if ((err = this->parse_suffixed(&operand)))
        return err;

    out->op = op;
    out->items.push_back(std::move(operand));
    return std::nullopt;
}

MaybeError GrammarLoader::parse_sequence(Expr *out)
{
    MaybeError err;
    std::vector<Expr> items;

    while (!this->at_sequence_end()) {
        Expr item;
        if ((err = this->parse_prefixed(&item)))
            return err;
        items.push_back(std::move(item));
    }

    if (items.empty())
        return this->unexpected("an expression");

    if (items.size() == 1) {
        *out = std::move(items.front());
    } else {
        out->op = Expr::Op::SEQUENCE;
        out->items = std::move(items);
    }
    return std::nullopt;
}

MaybeError GrammarLoader::parse_choice(Expr *out)
{
    MaybeError err;
    Expr first;

    if ((err = this->parse_sequence(&first)))
        return err;

    if (this->peek().type != Token::Type::PIPE) {
        *out = std::move(first);
        return std::nullopt;
    }

    out->op = Expr::Op::CHOICE;
    out->items.push_back(std::move(first));

    while (this->peek().type == Token::Type::PIPE) {
        ++this->pos;
        Expr alt;
        if ((err = this->parse_sequence(&alt)))
            return err;
        out->items.push_back(std::move(alt));
    }
    return std::nullopt;
}

MaybeError GrammarLoader::parse_rule(void)
{
    MaybeError err;
    bool atomic = false;

    if (this->peek().type == Token::Type::AT) {
        atomic = true;
        ++this->pos;
    }

    const Token &name = this->peek();
    if (name.type != Token::Type::NAME)
        return this->unexpected("a rule name");
    ++this->pos;

    if (this->peek().type != Token::Type::EQUALS)
        return this->unexpected("'='");
    ++this->pos;

    std::optional<Symbol> sym = lookup_symbol(name.value);
    if (!sym) {
        return grammar_error(name.line, name.column,
                             "unknown rule '" + name.value + "'");
    }

    if (*sym == Symbol::EOI) {
        return grammar_error(name.line, name.column,
                             "can't redefine builtin rule '" + name.value
                             + "'");
    }

    RuleDef &def = this->grammar->rules[static_cast<size_t>(*sym)];
    if (def.defined) {
        return grammar_error(name.line, name.column,
                             "rule '" + name.value + "' is already defined");
    }

    if ((err = this->parse_choice(&def.body)))
        return err;

    def.defined = true;
    def.atomic = atomic;
    def.silent = std::isupper(static_cast<unsigned char>(name.value[0]));

    LOG(TRACE) << "Loaded " << (atomic ? "atomic " : "")
               << (def.silent ? "silent " : "") << "rule '"
               << name.value << "'.";
    return std::nullopt;
}

MaybeError GrammarLoader::load(void)
{
    MaybeError err;

    while (this->peek().type != Token::Type::END) {
        if ((err = this->parse_rule()))
            return err;
    }

    for (const std::pair<Symbol, const Token*> &ref : this->references) {
        if (!this->grammar->rule(ref.first).defined) {
            return grammar_error(ref.second->line, ref.second->column,
                                 "rule '" + ref.second->value
                                 + "' is used but never defined");
        }
    }

    return std::nullopt;
}

Grammar::Grammar() : rules(symbol_count)
{
}

MaybeError Grammar::load(const std::string &source, Grammar *out)
{
    MaybeError err;
    std::vector<Token> tokens;

    GrammarLexer lexer(source);
    if ((err = lexer.tokenize(&tokens)))
        return err;

    Grammar grammar;
    GrammarLoader loader(tokens, &grammar);
    if ((err = loader.load()))
        return err;

    *out = std::move(grammar);
    return std::nullopt;
}

/* Matching of input text against a loaded grammar. All of the state lives in
 * the Matcher, so a Grammar can be shared between threads.
 */

class Matcher
{
    const Grammar &grammar;
    const std::string &input;
    size_t failpos;
    std::vector<std::string> expected;
    int quiet;

    public:
        Matcher(const Grammar &g, const std::string &i)
            : grammar(g), input(i), failpos(0), expected(), quiet(0) {}

        bool match(const Expr&, size_t&, std::vector<ParseNode>&);
        bool match_rule(Symbol, size_t&, std::vector<ParseNode>&);
        void expect(size_t, const std::string&);

        inline SyntaxFailure failure(Symbol start) const {
            SyntaxFailure result{this->failpos, this->expected};
            if (result.expected.empty())
                result.expected.push_back(describe_symbol(start));
            return result;
        }
};

void Matcher::expect(size_t pos, const std::string &label)
{
    if (this->quiet > 0 || pos < this->failpos)
        return;

    if (pos > this->failpos) {
        this->failpos = pos;
        this->expected.clear();
    }

    if (std::find(this->expected.begin(), this->expected.end(), label)
        == this->expected.end())
        this->expected.push_back(label);
}

bool Matcher::match(const Expr &expr, size_t &pos,
                    std::vector<ParseNode> &out)
{
    size_t start = pos;
    size_t mark = out.size();

    switch (expr.op) {
        case Expr::Op::LITERAL:
            if (this->input.compare(pos, expr.text.size(), expr.text) == 0) {
                pos += expr.text.size();
                return true;
            }
            this->expect(pos, '"' + expr.text + '"');
            return false;

        case Expr::Op::CLASS:
            if (pos < this->input.size() &&
                expr.class_matches(this->input[pos])) {
                ++pos;
                return true;
            }
            this->expect(pos, expr.text);
            return false;

        case Expr::Op::EOI:
            if (pos == this->input.size())
                return true;
            this->expect(pos, describe_symbol(Symbol::EOI));
            return false;

        case Expr::Op::RULE:
            return this->match_rule(expr.rule, pos, out);

        case Expr::Op::SEQUENCE:
            for (const Expr &item : expr.items) {
                if (!this->match(item, pos, out)) {
                    pos = start;
                    out.erase(out.begin() + mark, out.end());
                    return false;
                }
            }
            return true;

        case Expr::Op::CHOICE:
            for (const Expr &item : expr.items) {
                if (this->match(item, pos, out))
                    return true;
            }
            return false;

        case Expr::Op::OPTIONAL:
            this->match(expr.items.front(), pos, out);
            return true;

        case Expr::Op::STAR:
        case Expr::Op::PLUS: {
            size_t count = 0;
            for (;;) {
                size_t before = pos;
                if (!this->match(expr.items.front(), pos, out))
                    break;
                ++count;
                if (pos == before)
                    break;
            }
            return expr.op == Expr::Op::STAR || count > 0;
        }

        case Expr::Op::AND: {
            std::vector<ParseNode> scratch;
            size_t lookahead = pos;
            return this->match(expr.items.front(), lookahead, scratch);
        }

        case Expr::Op::NOT: {
            std::vector<ParseNode> scratch;
            size_t lookahead = pos;
            ++this->quiet;
            bool matched = this->match(expr.items.front(), lookahead, scratch);
            --this->quiet;
            return !matched;
        }
    }

    return false;
}

bool Matcher::match_rule(Symbol sym, size_t &pos, std::vector<ParseNode> &out)
{
    const RuleDef &def = this->grammar.rule(sym);
    size_t start = pos;
    std::vector<ParseNode> children;

    if (def.atomic)
        ++this->quiet;

    bool matched = this->match(def.body, pos, children);

    if (def.atomic) {
        --this->quiet;
        children.clear();
        if (!matched)
            this->expect(start, describe_symbol(sym));
    }

    if (!matched)
        return false;

    if (def.silent) {
        std::move(children.begin(), children.end(), std::back_inserter(out));
        return true;
    }

    out.push_back(ParseNode{sym, start, pos,
                            this->input.substr(start, pos - start),
                            std::move(children)});
    return true;
}

std::optional<SyntaxFailure> Grammar::match(Symbol start,
                                            const std::string &input,
                                            ParseNode *out) const
{
    if (start == Symbol::EOI || !this->rule(start).defined) {
        throw std::invalid_argument(std::string("Rule '") + symbol_name(start)
                                    + "' is not defined in this grammar.");
    }

    Matcher matcher(*this, input);
    size_t pos = 0;
    std::vector<ParseNode> nodes;

    if (!matcher.match_rule(start, pos, nodes))
        return matcher.failure(start);

    if (pos != input.size()) {
        matcher.expect(pos, describe_symbol(Symbol::EOI));
        return matcher.failure(start);
    }

    if (nodes.size() == 1 && nodes.front().symbol == start) {
        *out = std::move(nodes.front());
    } else {
        *out = ParseNode{start, 0, pos, input, std::move(nodes)};
    }
    return std::nullopt;
}

const Grammar &firewall_grammar(void)
{
    static const Grammar grammar = []() {
        Grammar result;
        MaybeError err = Grammar::load(ufwparse_grammar_text, &result);
        if (err) {
            LOG(FATAL) << "Unable to load builtin grammar: " << *err;
            throw std::logic_error("Invalid builtin grammar: " + *err);
        }
        LOG(DEBUG) << "Loaded builtin grammar.";
        return result;
    }();
    return grammar;
}

std::optional<SyntaxFailure> match_grammar(Symbol start,
                                           const std::string &input,
                                           ParseNode *out)
{
    return firewall_grammar().match(start, input, out);
}
