#include <rr/resolver.hpp>

#include <rr/core/search_paths.hpp>

#include <wolv/utils/string.hpp>

namespace rr {

    BuiltinResolver::BuiltinResolver() : Resolver("builtin") {
        this->m_platform        = std::make_shared<core::HostPlatform>();
        this->m_fileSystem      = std::make_shared<core::HostFileSystem>();
        this->m_assemblyLoader  = std::make_shared<core::NullAssemblyLoader>();
    }

    std::string BuiltinResolver::getHighestInstalledFrameworkVersion() const {
        return HighestInstalledFrameworkVersion;
    }

    std::string BuiltinResolver::getReferenceAssembliesRootDirectory() const {
        if (!this->m_platform->isWindowsLike())
            return "";

        const auto programFiles = this->m_platform->getProgramFilesDirectory();
        if (!programFiles.has_value())
            return "";

        return wolv::util::toUTF8String(*programFiles / "Reference Assemblies" / "Microsoft" / "Framework" / ".NETFramework");
    }

    core::LogConsole BuiltinResolver::createLogConsole(const api::ResolutionConfig &config) {
        core::LogConsole console;
        console.setLogLevel(config.logLevel);
        console.setMessageCallback(config.logMessage);
        console.setWarningCallback(config.logWarning);
        console.setErrorCallback(config.logError);

        return console;
    }

    std::vector<std::fs::path> BuiltinResolver::getSearchPaths(const api::ResolutionConfig &config) const {
        return core::SearchPathBuilder(config, this->m_platform.get()).build(createLogConsole(config));
    }

    std::vector<api::ResolvedReference> BuiltinResolver::resolve(const api::ResolutionConfig &config, const std::vector<api::ReferenceRequest> &references) const {
        const auto console = createLogConsole(config);
        const auto searchPaths = core::SearchPathBuilder(config, this->m_platform.get()).build(console);

        const core::strategies::ProbeContext context = {
            .searchPaths    = searchPaths,
            .platform       = *this->m_platform,
            .fileSystem     = *this->m_fileSystem,
            .assemblyLoader = *this->m_assemblyLoader,
            .console        = console,
            .coreLibrary    = this->m_coreLibrary
        };

        std::vector<api::ResolvedReference> result;
        for (const auto &reference : references) {
            if (auto resolved = this->m_strategyChain.resolve(reference, context); resolved.has_value())
                result.push_back(std::move(*resolved));
        }

        return result;
    }

}
