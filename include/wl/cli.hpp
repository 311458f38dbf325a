#pragma once

#include "wl/options.hpp"

namespace wl
{
enum class ParseResult { Ok, Help, Error };

void print_usage(const char *prog);

// Fills opt from argv. Error messages go to stderr; usage is printed for
// -h/--help only.
ParseResult parse_args(int argc, char **argv, Options &opt);
} // namespace wl
