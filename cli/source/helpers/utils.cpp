#include <rr/cli/helpers/utils.hpp>
#include <rr/resolver_registry.hpp>

#include <fmt/format.h>

#include <map>

namespace rr::cli {

    namespace {

        const std::map<std::string, api::ResolutionEnvironment> Modes = {
            { "compile",    api::ResolutionEnvironment::CompileTimeLike },
            { "runtime",    api::ResolutionEnvironment::RuntimeLike     },
            { "design",     api::ResolutionEnvironment::DesignTimeLike  }
        };

    }

    void addResolutionOptions(CLI::App *subcommand, ResolutionOptions &options) {
        subcommand->add_option("-F,--framework-dir", options.frameworkDirectories, "Target framework directories")->take_all();
        subcommand->add_option("-I,--include", options.includeDirectories, "Explicit include directories")->take_all();
        subcommand->add_option("--core-dir", options.coreLibraryDirectory, "Core library directory");
        subcommand->add_option("--implicit-dir", options.implicitIncludeDirectory, "Implicit include directory");
        subcommand->add_option("-o,--output-dir", options.outputDirectory, "Output directory");
        subcommand->add_option("--framework-version", options.frameworkVersion, "Target framework version, e.g. v4.5.1");
        subcommand->add_option("--arch", options.processorArchitecture, "Target processor architecture");
        subcommand->add_option("--mode", options.mode, "Resolution mode")->default_val("compile")->check([](const std::string &value) -> std::string {
            if (Modes.contains(value))
                return "";
            else
                return "Invalid mode. Valid modes are: [compile, runtime, design]";
        });
        subcommand->add_flag("--external", options.externalResolver, "Prefer an externally provided resolver")->default_val(false);
        subcommand->add_option("--external-version", options.externalResolverVersion, "Version of the external resolver to prefer");
        subcommand->add_flag("-v,--verbose", options.verbose, "Verbose output")->default_val(false);
    }

    std::shared_ptr<Resolver> selectResolver(const ResolutionOptions &options) {
        std::optional<std::string> version;
        if (!options.externalResolverVersion.empty())
            version = options.externalResolverVersion;

        core::LogConsole console;
        console.setLogLevel(options.verbose ? core::LogConsole::Level::Debug : core::LogConsole::Level::Info);
        console.setMessageCallback([](const std::string &message) {
            fmt::print(stderr, "[INFO]  {}\n", message);
        });

        return getDefaultResolver(options.externalResolver, version, ResolverRegistry::getGlobal(), console);
    }

    api::ResolutionConfig createConfig(const ResolutionOptions &options, const Resolver &resolver) {
        api::ResolutionConfig config;

        config.environment                  = Modes.at(options.mode);
        config.targetFrameworkVersion       = options.frameworkVersion.empty() ? resolver.getHighestInstalledFrameworkVersion() : options.frameworkVersion;
        config.targetFrameworkDirectories   = options.frameworkDirectories;
        config.targetProcessorArchitecture  = options.processorArchitecture;
        config.outputDirectory              = options.outputDirectory;
        config.coreLibraryDirectory         = options.coreLibraryDirectory;
        config.explicitIncludeDirectories   = options.includeDirectories;
        config.implicitIncludeDirectory     = options.implicitIncludeDirectory;

        // Design time resolution also looks at the framework reference assemblies
        if (config.environment == api::ResolutionEnvironment::DesignTimeLike) {
            if (const auto root = resolver.getReferenceAssembliesRootDirectory(); !root.empty())
                config.targetFrameworkDirectories.push_back(std::fs::path(root) / config.targetFrameworkVersion);
        }

        config.logLevel = options.verbose ? core::LogConsole::Level::Debug : core::LogConsole::Level::Info;
        config.logMessage = [](const std::string &message) {
            fmt::print(stderr, "[INFO]  {}\n", message);
        };
        config.logWarning = [](const std::string &code, const std::string &message) {
            fmt::print(stderr, "[WARN]  {}: {}\n", code, message);
        };
        config.logError = [](const std::string &code, const std::string &message) {
            fmt::print(stderr, "[ERROR] {}: {}\n", code, message);
        };

        return config;
    }

}
