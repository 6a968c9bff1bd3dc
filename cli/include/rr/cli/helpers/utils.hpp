#pragma once

#include <rr/api.hpp>
#include <rr/resolver.hpp>

#include <CLI/CLI.hpp>

#include <memory>
#include <string>
#include <vector>

namespace rr::cli {

    struct ResolutionOptions {
        std::vector<std::fs::path> frameworkDirectories;
        std::vector<std::fs::path> includeDirectories;
        std::fs::path coreLibraryDirectory;
        std::fs::path implicitIncludeDirectory;
        std::fs::path outputDirectory;

        std::string frameworkVersion;
        std::string processorArchitecture;
        std::string mode = "compile";

        bool externalResolver = false;
        std::string externalResolverVersion;

        bool verbose = false;
    };

    /**
     * @brief Adds the options shared by all subcommands that resolve something
     */
    void addResolutionOptions(CLI::App *subcommand, ResolutionOptions &options);

    [[nodiscard]] std::shared_ptr<Resolver> selectResolver(const ResolutionOptions &options);

    /**
     * @brief Builds a configuration that prints all log output to stderr
     */
    [[nodiscard]] api::ResolutionConfig createConfig(const ResolutionOptions &options, const Resolver &resolver);

}
