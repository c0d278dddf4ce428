// SPDX-License-Identifier: LGPL-3.0-only
#include <getopt.h>
#include <unistd.h>
#include <errno.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "emit.hh"
#include "logging.hh"
#include "rules.hh"
#include "serial.hh"

#ifndef VERSION
#define VERSION "unknown"
#endif

enum class OutputFormat { DEBUG, YAML, JSON, RULES };

struct RuleInput {
    std::string name;
    std::string text;
};

#define COMMON "[-v...] [-c | -p | -F FORMAT] [-o FILE]"

static void print_usage(char *prog, FILE *fp)
{
    fprintf(fp, "Usage: %s " COMMON " FILE...\n", prog);
    fprintf(fp, "       %s " COMMON " -r RULE [-r RULE]...\n", prog);
    fprintf(fp, "       %s -h\n", prog);
    fprintf(fp, "       %s --version\n", prog);
    fprintf(fp, "       %s --credits\n", prog);
    fputs("\nParse ufw-style firewall rules from one or more FILE\n", fp);
    fputs("arguments or directly from one or more RULE arguments and\n", fp);
    fputs("print them in a structured form.\n", fp);
    fputs("\nOptions:\n", fp);
    fputs("  -h, --help          Show this usage\n",                     fp);
    fputs("      --version       Output version information and exit\n", fp);
    fputs("      --credits       Show credits and exit\n",               fp);
    fputs("  -c, --check         Validate rules and exit\n",             fp);
    fputs("  -p, --print         Print out the table of rules\n",        fp);
    fputs("  -F, --format=FORMAT Output format: debug, yaml, json or\n", fp);
    fputs("                      rules (default: debug)\n",              fp);
    fputs("  -o, --output=FILE   Write output to FILE instead of\n",     fp);
    fputs("                      standard output\n",                     fp);
    fputs("  -r, --rule=RULE     A single rule\n",                       fp);
    fputs("  -v, --verbose       Increase level of verbosity\n",         fp);
    fputs("\nA FILE of '-' reads rules from standard input.\n",          fp);
    fputs("\nEnvironment:\n",                                            fp);
    fputs("  UFWPARSE_FORMAT     Default output format\n",               fp);
    fputs("  UFWPARSE_VERBOSITY  Initial verbosity level (0-5), raised\n", fp);
    fputs("                      by each -v\n",                          fp);
}

static void print_version(void)
{
    fputs("ufwparse " VERSION "\n"
          "This program is free software; you may redistribute it under\n"
          "the terms of the GNU Lesser General Public License version 3.\n",
          stdout);
}

static void print_credits(void)
{
    fputs("ufwparse " VERSION "\n"
          "\n"
          "The rule language follows the simple syntax of the\n"
          "Uncomplicated Firewall (ufw) from the Ubuntu project.\n"
          "\n"
          "Structured output is produced with yaml-cpp by Jesse Beder\n"
          "and contributors.\n",
          stdout);
}

static std::optional<OutputFormat> parse_format(const std::string &name)
{
    if (name == "debug")
        return OutputFormat::DEBUG;
    else if (name == "yaml")
        return OutputFormat::YAML;
    else if (name == "json")
        return OutputFormat::JSON;
    else if (name == "rules")
        return OutputFormat::RULES;
    return std::nullopt;
}

static bool read_rule_file(const std::string &filename, std::string *out)
{
    if (filename == "-") {
        std::ostringstream buf;
        buf << std::cin.rdbuf();
        if (std::cin.bad()) {
            fprintf(stderr, "Error reading rules from standard input: %s\n",
                    strerror(errno));
            return false;
        }
        *out = buf.str();
        return true;
    }

    std::ifstream input(filename, std::ios::binary);

    if (!input.is_open()) {
        fprintf(stderr, "Error opening rule file '%s': %s\n",
                filename.c_str(), strerror(errno));
        return false;
    }

    out->assign(std::istreambuf_iterator<char>(input),
                std::istreambuf_iterator<char>());

    if (input.bad()) {
        fprintf(stderr, "Error reading rule file '%s': %s\n",
                filename.c_str(), strerror(errno));
        return false;
    }

    return true;
}

static std::string render(OutputFormat format,
                          const std::vector<FirewallRule> &rules)
{
    std::ostringstream out;

    switch (format) {
        case OutputFormat::DEBUG:
            print_rules(rules, out);
            break;
        case OutputFormat::YAML:
            out << rules_to_yaml(rules);
            break;
        case OutputFormat::JSON:
            out << rules_to_json(rules);
            break;
        case OutputFormat::RULES:
            serialise(rules, out);
            break;
    }

    return out.str();
}

static bool write_output(const std::optional<std::string> &outfile,
                         const std::string &data)
{
    if (!outfile) {
        std::cout << data;
        std::cout.flush();
        if (!std::cout) {
            fprintf(stderr, "Error writing to standard output.\n");
            return false;
        }
        return true;
    }

    std::ofstream output(*outfile, std::ios::binary | std::ios::trunc);

    if (!output.is_open()) {
        fprintf(stderr, "Error opening output file '%s': %s\n",
                outfile->c_str(), strerror(errno));
        return false;
    }

    output << data;
    output.close();

    if (output.fail()) {
        fprintf(stderr, "Error writing output file '%s': %s\n",
                outfile->c_str(), strerror(errno));
        return false;
    }

    LOG(INFO) << "Wrote " << data.size() << " bytes to '" << *outfile
              << "'.";
    return true;
}

int main(int argc, char *argv[])
{
    int c;
    char *self = argv[0];

    bool check_only = false;
    unsigned int verbosity = 0;
    std::optional<OutputFormat> format = std::nullopt;
    std::optional<std::string> outfile = std::nullopt;

    static struct option lopts[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {"credits", no_argument, nullptr, 'C'},
        {"check", no_argument, nullptr, 'c'},
        {"print", no_argument, nullptr, 'p'},
        {"format", required_argument, nullptr, 'F'},
        {"output", required_argument, nullptr, 'o'},
        {"rule", required_argument, nullptr, 'r'},
        {"verbose", no_argument, nullptr, 'v'},
        {nullptr, 0, nullptr, 0}
    };

    std::vector<std::string> rule_args;

    while ((c = getopt_long(argc, argv, "hcpF:o:r:v",
                            lopts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                print_usage(self, stdout);
                return EXIT_SUCCESS;

            case 'V':
                print_version();
                return EXIT_SUCCESS;

            case 'C':
                print_credits();
                return EXIT_SUCCESS;

            case 'c':
                check_only = true;
                break;

            case 'p':
                format = OutputFormat::DEBUG;
                break;

            case 'F':
                if (!(format = parse_format(optarg))) {
                    fprintf(stderr, "%s: Invalid output format '%s'.\n\n",
                            self, optarg);
                    print_usage(self, stderr);
                    return EXIT_FAILURE;
                }
                break;

            case 'o':
                outfile = std::string(optarg);
                break;

            case 'r':
                rule_args.push_back(optarg);
                break;

            case 'v':
                verbosity++;
                break;

            default:
                fputc('\n', stderr);
                print_usage(self, stderr);
                return EXIT_FAILURE;
        }
    }

    if (verbosity > 0) {
        unsigned int level = static_cast<unsigned int>(get_verbosity())
                           + verbosity;
        set_verbosity(static_cast<Verbosity>(
            std::min(level, static_cast<unsigned int>(Verbosity::TRACE))
        ));
    }

    if (!format) {
        const char *env = getenv("UFWPARSE_FORMAT");
        if (env != nullptr && *env != '\0') {
            if (!(format = parse_format(env))) {
                fprintf(stderr, "%s: Invalid output format '%s' in"
                                " UFWPARSE_FORMAT.\n", self, env);
                return EXIT_FAILURE;
            }
        } else {
            format = OutputFormat::DEBUG;
        }
    }

    argc -= optind;
    argv += optind;

    if (!rule_args.empty() && argc > 0) {
        fprintf(stderr, "%s: Can't specify both direct rules and rule"
                        " files.\n\n", self);
        print_usage(self, stderr);
        return EXIT_FAILURE;
    }

    std::vector<RuleInput> inputs;

    if (!rule_args.empty()) {
        size_t rulepos = 0;
        for (const std::string &arg : rule_args)
            inputs.push_back({"rule #" + std::to_string(++rulepos), arg});
    } else if (argc > 0) {
        for (int i = 0; i < argc; ++i) {
            RuleInput input{argv[i], ""};
            if (input.name == "-")
                input.name = "<stdin>";
            if (!read_rule_file(argv[i], &input.text))
                return EXIT_FAILURE;
            inputs.push_back(input);
        }
    } else {
        fprintf(stderr, "%s: You need to either specify one or more rule"
                        " files or directly specify rules via '-r'.\n\n",
                self);
        print_usage(self, stderr);
        return EXIT_FAILURE;
    }

    std::vector<FirewallRule> rules;

    for (const RuleInput &input : inputs) {
        std::vector<FirewallRule> parsed;
        std::optional<ParseError> err = parse_rules(input.text, &parsed);

        if (err) {
            print_error(*err, input.text, input.name, std::cerr);
            return EXIT_FAILURE;
        }

        LOG(INFO) << "Parsed " << parsed.size() << " rule(s) from "
                  << input.name << '.';
        rules.insert(rules.end(), parsed.begin(), parsed.end());
    }

    if (check_only)
        return EXIT_SUCCESS;

    if (!write_output(outfile, render(*format, rules)))
        return EXIT_FAILURE;

    return EXIT_SUCCESS;
}
