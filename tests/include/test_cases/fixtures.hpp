#pragma once

#include <rr/api.hpp>
#include <rr/core/assembly_loader.hpp>
#include <rr/core/errors/resolver_errors.hpp>
#include <rr/core/file_system.hpp>
#include <rr/core/platform.hpp>
#include <rr/helpers/types.hpp>

#include <wolv/io/file.hpp>
#include <wolv/io/fs.hpp>
#include <wolv/utils/string.hpp>

#include <fmt/format.h>

#include <map>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace rr::test {

    /**
     * @brief Directory below the system temp directory that is removed again with everything in it
     */
    class TemporaryDirectory {
    public:
        explicit TemporaryDirectory(const std::string &name) {
            this->m_path = std::fs::temp_directory_path() / fmt::format("rr_tests_{}_{:08x}", name, std::random_device()());
            std::fs::create_directories(this->m_path);
        }

        ~TemporaryDirectory() {
            std::error_code error;
            std::fs::remove_all(this->m_path, error);
        }

        TemporaryDirectory(const TemporaryDirectory &) = delete;
        TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

        [[nodiscard]] const std::fs::path &path() const {
            return this->m_path;
        }

        std::fs::path createDirectory(const std::fs::path &relativePath) const {
            auto path = this->m_path / relativePath;
            std::fs::create_directories(path);

            return path;
        }

        std::fs::path createFile(const std::fs::path &relativePath) const {
            auto path = this->m_path / relativePath;
            std::fs::create_directories(path.parent_path());

            wolv::io::File file(path, wolv::io::File::Mode::Create);
            file.writeString("MZ");

            return path;
        }

    private:
        std::fs::path m_path;
    };

    /**
     * @brief How a fake collaborator fails
     */
    enum class Failure {
        Diagnostic,
        Standard,
        Foreign
    };

    /**
     * @brief Host file system that counts file probes and can be told to fail on certain paths
     */
    class CountingFileSystem final : public core::FileSystem {
    public:
        [[nodiscard]] bool fileExists(const std::fs::path &path) const override {
            this->m_fileProbes[path]++;

            if (auto it = this->m_failingPaths.find(path); it != this->m_failingPaths.end()) {
                switch (it->second) {
                    using enum Failure;

                    case Diagnostic:
                        core::err::SR001.throwError(fmt::format("Access to '{}' denied", wolv::util::toUTF8String(path)));
                    case Standard:
                        throw std::runtime_error(fmt::format("Device not ready: '{}'", wolv::util::toUTF8String(path)));
                    case Foreign:
                        throw 5;
                }
            }

            return this->m_host.fileExists(path);
        }

        [[nodiscard]] bool directoryExists(const std::fs::path &path) const override {
            return this->m_host.directoryExists(path);
        }

        [[nodiscard]] std::vector<std::fs::path> listDirectories(const std::fs::path &path) const override {
            return this->m_host.listDirectories(path);
        }

        void failOn(const std::fs::path &path, Failure failure = Failure::Diagnostic) {
            this->m_failingPaths[path] = failure;
        }

        void resetCounters() {
            this->m_fileProbes.clear();
        }

        [[nodiscard]] u32 getFileProbes(const std::fs::path &path) const {
            if (auto it = this->m_fileProbes.find(path); it != this->m_fileProbes.end())
                return it->second;

            return 0;
        }

        [[nodiscard]] u32 getTotalFileProbes() const {
            u32 total = 0;
            for (const auto &[path, count] : this->m_fileProbes)
                total += count;

            return total;
        }

    private:
        core::HostFileSystem m_host;
        mutable std::map<std::fs::path, u32> m_fileProbes;
        std::map<std::fs::path, Failure> m_failingPaths;
    };

    class FakePlatform final : public core::Platform {
    public:
        [[nodiscard]] bool isWindowsLike() const override {
            return this->windowsLike;
        }

        [[nodiscard]] std::optional<std::string> getEnvironmentVariable(const std::string &name) const override {
            if (auto it = this->environment.find(name); it != this->environment.end())
                return it->second;

            return std::nullopt;
        }

        [[nodiscard]] std::vector<std::fs::path> enumerateAssemblyFolders() const override {
            if (this->failDiscovery)
                core::err::SR002.throwError("Registry is not accessible");

            return this->assemblyFolders;
        }

        [[nodiscard]] std::optional<std::fs::path> getRuntimeDirectory() const override {
            return this->runtimeDirectory;
        }

        bool windowsLike = true;
        bool failDiscovery = false;
        std::map<std::string, std::string> environment;
        std::vector<std::fs::path> assemblyFolders;
        std::optional<std::fs::path> runtimeDirectory;
    };

    class FakeAssemblyLoader final : public core::AssemblyLoader {
    public:
        [[nodiscard]] std::optional<std::fs::path> load(const std::string &descriptor) const override {
            this->m_loadCalls++;

            if (this->throwOnLoad)
                throw std::runtime_error(fmt::format("Could not load file or assembly '{}'", descriptor));
            if (this->throwForeignOnLoad)
                throw 42;

            if (auto it = this->assemblies.find(descriptor); it != this->assemblies.end())
                return it->second;

            return std::nullopt;
        }

        [[nodiscard]] u32 getLoadCalls() const {
            return this->m_loadCalls;
        }

        bool throwOnLoad = false;
        bool throwForeignOnLoad = false;
        std::map<std::string, std::fs::path> assemblies;

    private:
        mutable u32 m_loadCalls = 0;
    };

    /**
     * @brief Collects everything a resolve call logs
     */
    struct LogCapture {
        struct Diagnostic {
            std::string code;
            std::string message;
        };

        std::vector<std::string> messages;
        std::vector<Diagnostic> warnings;
        std::vector<Diagnostic> errors;

        void attach(api::ResolutionConfig &config) {
            config.logMessage = [this](const std::string &message) {
                this->messages.push_back(message);
            };
            config.logWarning = [this](const std::string &code, const std::string &message) {
                this->warnings.push_back({ code, message });
            };
            config.logError = [this](const std::string &code, const std::string &message) {
                this->errors.push_back({ code, message });
            };
        }

        void clear() {
            this->messages.clear();
            this->warnings.clear();
            this->errors.clear();
        }
    };

    [[nodiscard]] inline std::string toString(const std::fs::path &path) {
        return wolv::util::toUTF8String(path);
    }

}
