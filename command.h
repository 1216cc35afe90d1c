#ifndef STRATA_COMMAND_H
#define STRATA_COMMAND_H

#include <string>
#include <vector>

struct RunMode {
    bool verbose = false;
};

void print_command(const std::vector<std::string> &argv, const RunMode &mode);

// Runs argv[0] from PATH and waits for it. Returns the exit status, 127 when
// the program could not be executed, 1 on fork/wait failure or a signal.
int run_command(const std::vector<std::string> &argv, const RunMode &mode);

// Same as run_command, collecting the child's stdout into *out.
int run_command_output(const std::vector<std::string> &argv, const RunMode &mode, std::string *out);

// Runs the command under "nice -n 19 ionice -c 3 -n7".
int run_nice_ionice(const std::vector<std::string> &args, const RunMode &mode);

bool command_available(const std::string &name);

#endif
