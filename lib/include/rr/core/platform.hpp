#pragma once

#include <optional>
#include <string>
#include <vector>

#include <wolv/io/fs.hpp>

namespace rr::core {

    /**
     * @brief Read-only view of the host operating system
     */
    class Platform {
    public:
        virtual ~Platform() = default;

        /**
         * @brief Whether the host has the Windows specific directory layout and registry
         */
        [[nodiscard]] virtual bool isWindowsLike() const = 0;

        [[nodiscard]] virtual std::optional<std::string> getEnvironmentVariable(const std::string &name) const = 0;

        /**
         * @brief Lists the assembly folders registered with the system
         * @note May throw err::Diagnostic::Exception if the registry cannot be read
         */
        [[nodiscard]] virtual std::vector<std::fs::path> enumerateAssemblyFolders() const = 0;

        /**
         * @brief Directory of the installed runtime, e.g. C:\Windows\Microsoft.NET\Framework64\v4.0.30319
         */
        [[nodiscard]] virtual std::optional<std::fs::path> getRuntimeDirectory() const = 0;

        /**
         * @brief The 32 bit program files directory, falling back to the native one
         */
        [[nodiscard]] std::optional<std::fs::path> getProgramFilesDirectory() const;
    };

    class HostPlatform final : public Platform {
    public:
        [[nodiscard]] bool isWindowsLike() const override;
        [[nodiscard]] std::optional<std::string> getEnvironmentVariable(const std::string &name) const override;
        [[nodiscard]] std::vector<std::fs::path> enumerateAssemblyFolders() const override;
        [[nodiscard]] std::optional<std::fs::path> getRuntimeDirectory() const override;
    };

    /**
     * @brief A platform that offers nothing. Every platform dependent strategy is skipped
     */
    class NullPlatform final : public Platform {
    public:
        [[nodiscard]] bool isWindowsLike() const override { return false; }
        [[nodiscard]] std::optional<std::string> getEnvironmentVariable(const std::string &) const override { return std::nullopt; }
        [[nodiscard]] std::vector<std::fs::path> enumerateAssemblyFolders() const override { return { }; }
        [[nodiscard]] std::optional<std::fs::path> getRuntimeDirectory() const override { return std::nullopt; }
    };

}
