#include <rr/core/file_system.hpp>
#include <rr/core/errors/resolver_errors.hpp>

#include <wolv/utils/string.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <system_error>

namespace rr::core {

    namespace {

        bool isMissing(const std::error_code &error) {
            return error == std::errc::no_such_file_or_directory || error == std::errc::not_a_directory;
        }

        std::fs::file_status queryStatus(const std::fs::path &path) {
            std::error_code error;
            auto status = std::fs::status(path, error);

            if (error && !isMissing(error))
                err::SR001.throwError(fmt::format("Could not access '{}': {}", wolv::util::toUTF8String(path), error.message()));

            return status;
        }

    }

    bool HostFileSystem::fileExists(const std::fs::path &path) const {
        const auto status = queryStatus(path);

        return std::fs::exists(status) && !std::fs::is_directory(status);
    }

    bool HostFileSystem::directoryExists(const std::fs::path &path) const {
        return std::fs::is_directory(queryStatus(path));
    }

    std::vector<std::fs::path> HostFileSystem::listDirectories(const std::fs::path &path) const {
        std::vector<std::fs::path> result;

        std::error_code error;
        for (auto it = std::fs::directory_iterator(path, error); !error && it != std::fs::directory_iterator(); it.increment(error)) {
            std::error_code entryError;
            if (it->is_directory(entryError))
                result.push_back(it->path());
        }

        if (error) {
            if (isMissing(error))
                return { };

            err::SR001.throwError(fmt::format("Could not enumerate '{}': {}", wolv::util::toUTF8String(path), error.message()));
        }

        std::sort(result.begin(), result.end());

        return result;
    }

}
