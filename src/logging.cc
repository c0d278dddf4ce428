// SPDX-License-Identifier: LGPL-3.0-only
#include <unistd.h>
#include <stdlib.h>
#include <atomic>
#include <iostream>

#include "logging.hh"

static Verbosity verbosity_from_env(void)
{
    const char *env = getenv("UFWPARSE_VERBOSITY");
    if (env == nullptr || *env < '0' || *env > '9')
        return Verbosity::FATAL;

    int level = atoi(env);
    if (level > static_cast<int>(Verbosity::TRACE))
        return Verbosity::TRACE;
    return static_cast<Verbosity>(level);
}

static std::atomic<Verbosity> &current_verbosity(void)
{
    static std::atomic<Verbosity> verbosity(verbosity_from_env());
    return verbosity;
}

Verbosity get_verbosity(void)
{
    return current_verbosity().load();
}

void set_verbosity(Verbosity level)
{
    current_verbosity().store(level);
}

Logger::Logger(Verbosity verbosity, const std::string_view &file, int line,
               const char *fun, const char *label)
    : logbuf(std::nullopt)
{
    Verbosity current = get_verbosity();

    if (verbosity <= current) {
        this->logbuf.emplace();

        *this->logbuf << "ufwparse";

        if (current >= Verbosity::DEBUG) {
            *this->logbuf << '[' << getpid() << "] ";
            *this->logbuf << file << ':' << line << ':' << fun;
        }

        *this->logbuf << ' ' << label << ": ";
    }
}

Logger::~Logger()
{
    if (this->logbuf) {
        *this->logbuf << std::endl;
        std::cerr << this->logbuf->str();
    }
}
