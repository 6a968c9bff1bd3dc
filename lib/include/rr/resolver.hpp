#pragma once

#include <memory>
#include <string>
#include <vector>

#include <rr/api.hpp>

#include <rr/core/assembly_loader.hpp>
#include <rr/core/file_system.hpp>
#include <rr/core/log_console.hpp>
#include <rr/core/platform.hpp>
#include <rr/core/strategy_chain.hpp>

#include <wolv/io/fs.hpp>

namespace rr {

    /**
     * @brief Turns textual library references into file system locations
     */
    class Resolver {
    public:
        explicit Resolver(std::string name) : m_name(std::move(name)) { }
        virtual ~Resolver() = default;

        Resolver(const Resolver&) = delete;
        Resolver &operator=(const Resolver&) = delete;

        [[nodiscard]] const std::string &getName() const {
            return this->m_name;
        }

        /**
         * @brief Get the "v4.5.1"-style moniker of the highest installed framework version.
         * This is what callers pass as target framework version when nothing was requested explicitly
         */
        [[nodiscard]] virtual std::string getHighestInstalledFrameworkVersion() const = 0;

        /**
         * @brief Root of the framework reference assemblies. Added to the search path of design time resolutions.
         * Empty if the platform has none
         */
        [[nodiscard]] virtual std::string getReferenceAssembliesRootDirectory() const = 0;

        /**
         * @brief Resolves references
         * @param config Directories, target and log sinks for this call
         * @param references References to resolve
         * @return Resolved references in input order. References that could not be resolved are left out. Never throws
         */
        [[nodiscard]] virtual std::vector<api::ResolvedReference> resolve(const api::ResolutionConfig &config, const std::vector<api::ReferenceRequest> &references) const = 0;

    private:
        std::string m_name;
    };

    /**
     * @brief The resolver that ships with the library. Searches the file system the way a build tool would, without needing one
     * @note Collaborators default to the host platform, the host file system and a loader that never loads anything
     */
    class BuiltinResolver final : public Resolver {
    public:
        BuiltinResolver();

        constexpr static auto HighestInstalledFrameworkVersion = "v4.5";

        [[nodiscard]] std::string getHighestInstalledFrameworkVersion() const override;
        [[nodiscard]] std::string getReferenceAssembliesRootDirectory() const override;
        [[nodiscard]] std::vector<api::ResolvedReference> resolve(const api::ResolutionConfig &config, const std::vector<api::ReferenceRequest> &references) const override;

        /**
         * @brief Candidate directories a resolve call with this configuration would probe, in priority order
         */
        [[nodiscard]] std::vector<std::fs::path> getSearchPaths(const api::ResolutionConfig &config) const;

        void setPlatform(std::shared_ptr<const core::Platform> platform) {
            if (platform == nullptr)
                this->m_platform = std::make_shared<core::NullPlatform>();
            else
                this->m_platform = std::move(platform);
        }

        void setFileSystem(std::shared_ptr<const core::FileSystem> fileSystem) {
            if (fileSystem == nullptr)
                this->m_fileSystem = std::make_shared<core::HostFileSystem>();
            else
                this->m_fileSystem = std::move(fileSystem);
        }

        void setAssemblyLoader(std::shared_ptr<const core::AssemblyLoader> assemblyLoader) {
            if (assemblyLoader == nullptr)
                this->m_assemblyLoader = std::make_shared<core::NullAssemblyLoader>();
            else
                this->m_assemblyLoader = std::move(assemblyLoader);
        }

        void setCoreLibrary(const core::strategies::CoreLibraryFamily &coreLibrary) {
            this->m_coreLibrary = coreLibrary;
        }

        [[nodiscard]] const core::Platform &getPlatform() const { return *this->m_platform; }
        [[nodiscard]] const core::FileSystem &getFileSystem() const { return *this->m_fileSystem; }
        [[nodiscard]] const core::AssemblyLoader &getAssemblyLoader() const { return *this->m_assemblyLoader; }
        [[nodiscard]] const core::strategies::CoreLibraryFamily &getCoreLibrary() const { return this->m_coreLibrary; }

    private:
        [[nodiscard]] static core::LogConsole createLogConsole(const api::ResolutionConfig &config);

        std::shared_ptr<const core::Platform> m_platform;
        std::shared_ptr<const core::FileSystem> m_fileSystem;
        std::shared_ptr<const core::AssemblyLoader> m_assemblyLoader;
        core::strategies::CoreLibraryFamily m_coreLibrary;

        core::StrategyChain m_strategyChain;
    };

}
