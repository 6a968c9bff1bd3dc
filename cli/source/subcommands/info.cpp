#include <rr/resolver.hpp>
#include <rr/cli/helpers/utils.hpp>

#include <wolv/utils/string.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <nlohmann/json.hpp>

namespace rr::cli::sub {

    void addInfoSubcommand(CLI::App *app) {
        static ResolutionOptions options;
        static std::string formatterName;

        auto subcommand = app->add_subcommand("info", "Print information about the resolver and its search paths");

        // Add command line arguments
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

            // Only the builtin resolver exposes its search paths
            std::vector<std::string> searchPaths;
            if (auto builtinResolver = std::dynamic_pointer_cast<BuiltinResolver>(resolver); builtinResolver != nullptr) {
                for (const auto &path : builtinResolver->getSearchPaths(config))
                    searchPaths.push_back(wolv::util::toUTF8String(path));
            }

            if (formatterName == "json") {
                nlohmann::json json = {
                    { "resolver",                       resolver->getName() },
                    { "highestInstalledFramework",      resolver->getHighestInstalledFrameworkVersion() },
                    { "referenceAssembliesRoot",        resolver->getReferenceAssembliesRootDirectory() },
                    { "targetFramework",                config.targetFrameworkVersion },
                    { "searchPaths",                    searchPaths }
                };

                fmt::print("{}\n", json.dump(4));
            } else {
                fmt::print("Resolver: {}\n", resolver->getName());
                fmt::print("Highest installed framework: {}\n", resolver->getHighestInstalledFrameworkVersion());
                fmt::print("Reference assemblies root: {}\n", resolver->getReferenceAssembliesRootDirectory());
                fmt::print("Target framework: {}\n", config.targetFrameworkVersion);
                fmt::print("Search paths:\n");
                for (const auto &path : searchPaths)
                    fmt::print("    {}\n", path.empty() ? "<current directory>" : path);
            }
        });
    }

}
