#pragma once

#include <optional>
#include <string>

#include <wolv/io/fs.hpp>

namespace rr::core {

    /**
     * @brief Host runtime facility that loads an assembly by its strong-name descriptor and reports where it was loaded from
     */
    class AssemblyLoader {
    public:
        virtual ~AssemblyLoader() = default;

        /**
         * @brief Loads an assembly
         * @param descriptor Strong-name descriptor
         * @return Location of the loaded assembly, or std::nullopt if it could not be loaded
         * @note Implementations may throw, failures are treated the same as std::nullopt
         */
        [[nodiscard]] virtual std::optional<std::fs::path> load(const std::string &descriptor) const = 0;
    };

    /**
     * @brief Loader for hosts without a managed runtime
     */
    class NullAssemblyLoader final : public AssemblyLoader {
    public:
        [[nodiscard]] std::optional<std::fs::path> load(const std::string &) const override {
            return std::nullopt;
        }
    };

}
