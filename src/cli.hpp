#pragma once

#include "pipeline.hpp"

#include <iosfwd>
#include <string>
#include <vector>

struct Command {
    enum class Kind { Process, Search, Version, Help, Supported };

    Kind kind = Kind::Process;
    // URL for Process, phrase for Search.
    std::string argument;
    // Flags in effect at the point the command appeared.
    Options options;
};

// Flags apply to the URLs that follow them. "--search" takes the next
// argument and ends parsing. Throws UsageError on a malformed --jobs value.
std::vector<Command> parse_command_line(int argc, const char* const* argv, const std::string& default_output_dir);

void print_help(std::ostream& out);
