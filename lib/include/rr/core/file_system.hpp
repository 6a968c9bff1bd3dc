#pragma once

#include <vector>

#include <wolv/io/fs.hpp>

namespace rr::core {

    /**
     * @brief Read-only file system queries used by the resolution strategies
     * @note A missing path is never an error. Any other access failure throws err::Diagnostic::Exception
     */
    class FileSystem {
    public:
        virtual ~FileSystem() = default;

        /// True if path names an existing entry that is not a directory
        [[nodiscard]] virtual bool fileExists(const std::fs::path &path) const = 0;
        [[nodiscard]] virtual bool directoryExists(const std::fs::path &path) const = 0;

        /// Directories directly below path, sorted by name
        [[nodiscard]] virtual std::vector<std::fs::path> listDirectories(const std::fs::path &path) const = 0;
    };

    class HostFileSystem final : public FileSystem {
    public:
        [[nodiscard]] bool fileExists(const std::fs::path &path) const override;
        [[nodiscard]] bool directoryExists(const std::fs::path &path) const override;
        [[nodiscard]] std::vector<std::fs::path> listDirectories(const std::fs::path &path) const override;
    };

}
