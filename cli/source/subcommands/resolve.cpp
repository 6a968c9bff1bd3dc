#include <rr/resolver.hpp>
#include <rr/cli/helpers/utils.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <cstdlib>

namespace rr::cli::sub {

    void addResolveSubcommand(CLI::App *app) {
        static ResolutionOptions options;
        static std::vector<std::string> references;
        static std::vector<std::string> baggage;
        static std::string formatterName;

        auto subcommand = app->add_subcommand("resolve", "Resolve references to file paths");

        // Add command line arguments
        subcommand->add_option("-r,--reference,REFERENCE", references, "Path, file name or strong-name descriptor")->required()->take_all();
        subcommand->add_option("-b,--baggage", baggage, "Baggage handed back with the reference at the same position")->take_all();
        subcommand->add_option("-f,--formatter", formatterName, "Formatter")->default_val("pretty")->check([&](const auto &value) -> std::string {
            if (value == "pretty" || value == "json")
                return "";
            else
                return "Invalid formatter. Valid formatters are: [pretty, json]";
        });
        addResolutionOptions(subcommand, options);

        subcommand->callback([] {
            const auto resolver = selectResolver(options);
            const auto config = createConfig(options, *resolver);

            std::vector<api::ReferenceRequest> requests;
            for (size_t i = 0; i < references.size(); i++)
                requests.push_back({ references[i], i < baggage.size() ? baggage[i] : "" });

            const auto resolved = resolver->resolve(config, requests);

            if (formatterName == "json") {
                auto json = nlohmann::json::array();
                for (const auto &reference : resolved)
                    json.push_back({ { "path", reference.path }, { "baggage", reference.baggage } });

                fmt::print("{}\n", json.dump(4));
            } else {
                for (const auto &reference : resolved) {
                    if (reference.baggage.empty())
                        fmt::print("{}\n", reference.path);
                    else
                        fmt::print("{} [{}]\n", reference.path, reference.baggage);
                }
            }

            // Unresolved references are simply missing from the output
            if (resolved.size() != requests.size())
                std::exit(EXIT_FAILURE);
        });
    }

}
