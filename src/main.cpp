#include "cli.hpp"
#include "fetcher.hpp"
#include "pipeline.hpp"
#include "providers.hpp"
#include "search.hpp"
#include "tagger.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    try {
        auto commands = parse_command_line(argc, argv, std::filesystem::current_path().string());
        if (commands.empty()) {
            print_help(std::cout);
            return 0;
        }

        const ProviderRegistry& registry = ProviderRegistry::builtin();
        HttpFetcher fetcher;
        TagLibTagStore tags;
        Pipeline pipeline(registry, fetcher, tags);

        for (const auto& cmd : commands) {
            switch (cmd.kind) {
                case Command::Kind::Version:
                    std::cout << kVersion << std::endl;
                    break;
                case Command::Kind::Help:
                    print_help(std::cout);
                    break;
                case Command::Kind::Supported:
                    for (const auto& r : registry.rules()) std::cout << r.url_prefix << std::endl;
                    break;
                case Command::Kind::Search:
                    print_search_results(search_providers(cmd.argument, registry, fetcher), std::cout);
                    break;
                case Command::Kind::Process:
                    pipeline.process(cmd.argument, cmd.options);
                    break;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
