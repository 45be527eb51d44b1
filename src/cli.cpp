#include "cli.hpp"

#include "errors.hpp"
#include "text_utils.hpp"

#include <ostream>
#include <stdexcept>

namespace {

unsigned parse_jobs(const std::string& value) {
    unsigned long n = 0;
    try {
        size_t used = 0;
        n = std::stoul(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
    } catch (const std::exception&) {
        throw UsageError("Invalid --jobs value: " + value);
    }
    if (n == 0 || n > kMaxJobs) throw UsageError("--jobs must be between 1 and " + std::to_string(kMaxJobs));
    return static_cast<unsigned>(n);
}

}  // namespace

std::vector<Command> parse_command_line(int argc, const char* const* argv, const std::string& default_output_dir) {
    std::vector<Command> commands;
    Options options;
    options.output_dir = default_output_dir;

    auto push = [&](Command::Kind kind, std::string argument = {}) {
        Command c;
        c.kind = kind;
        c.argument = std::move(argument);
        c.options = options;
        commands.push_back(std::move(c));
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (starts_with(arg, "--output_dir=")) options.output_dir = arg.substr(13);
        else if (starts_with(arg, "--jobs=")) options.jobs = parse_jobs(arg.substr(7));
        else if (arg == "--dry_run") options.dry_run = true;
        else if (arg == "--no_tag") options.no_tag = true;
        else if (arg == "--manifest") options.write_manifest = true;
        else if (arg == "--pls") {
            options.playlist = true;
            options.playlist_format = "pls";
        }
        else if (arg == "--version") push(Command::Kind::Version);
        else if (arg == "--help" || arg == "-h") push(Command::Kind::Help);
        else if (arg == "--supported") push(Command::Kind::Supported);
        else if (arg == "--search") {
            push(Command::Kind::Search, i + 1 < argc ? argv[i + 1] : "");
            break;
        }
        else push(Command::Kind::Process, arg);
    }
    return commands;
}

void print_help(std::ostream& out) {
    out << "Usage: audiobook-dl [options] [URLs|--search PHRASE]\n"
        << "\n"
        << "Downloads resources referenced from a web page (e.g. chapters of an audiobook),\n"
        << "tags them and creates a playlist out of them.\n"
        << "\n"
        << "Options (apply to the URLs that follow them):\n"
        << "  --search PHRASE     Search supported providers for audiobooks\n"
        << "  --output_dir=DIR    Download location (default: current directory)\n"
        << "  --pls               Create a playlist file in the target directory\n"
        << "  --no_tag            Do not append chapter titles to title tags\n"
        << "  --dry_run           Only list target files and URLs, download nothing\n"
        << "  --manifest          Write manifest.json to the target directory\n"
        << "  --jobs=N            Download N files at a time (default: 1)\n"
        << "  --supported         List supported providers\n"
        << "  --version           Display version\n"
        << "  --help, -h          Display this message\n";
}
