#ifndef P21_CLI_HPP
#define P21_CLI_HPP

#include "../lib/strbuf.h"

namespace p21 {

// Command-line entry points. argv[1] is the command name; regular output is
// appended to out and diagnostics to err. Each returns the process exit status.

void print_help(StrBuf* out);

int exec_encode(int argc, char* argv[], StrBuf* out, StrBuf* err);
int exec_decode(int argc, char* argv[], StrBuf* out, StrBuf* err);
int exec_sample(int argc, char* argv[], StrBuf* out, StrBuf* err);

// dispatch on argv[1]; no command or --help prints the usage text
int exec_command(int argc, char* argv[], StrBuf* out, StrBuf* err);

} // namespace p21

#endif
