#pragma once

#include <rr/api.hpp>
#include <rr/core/assembly_loader.hpp>
#include <rr/core/file_system.hpp>
#include <rr/core/log_console.hpp>
#include <rr/core/platform.hpp>

#include <wolv/io/fs.hpp>

#include <string>
#include <utility>
#include <vector>

namespace rr::core::strategies {

    constexpr static auto AssemblyExtension = ".dll";
    constexpr static auto ExecutableExtension = ".exe";

    /**
     * @brief A core library that ships versioned reference assemblies under the program files directory
     */
    struct CoreLibraryFamily {
        std::string name = "FSharp.Core";
        std::fs::path referenceDirectory = std::fs::path("Reference Assemblies") / "Microsoft" / "FSharp" / ".NETFramework" / "v4.0";
    };

    /**
     * @brief Everything a strategy may look at while probing a single reference. Nothing in here is modified by a probe
     */
    struct ProbeContext {
        const std::vector<std::fs::path> &searchPaths;
        const Platform &platform;
        const FileSystem &fileSystem;
        const AssemblyLoader &assemblyLoader;
        const LogConsole &console;
        const CoreLibraryFamily &coreLibrary;
    };

    class StrategyResult {
    public:
        enum class Kind {
            Found,
            NotFound,
            ProbeError
        };

        [[nodiscard]] static StrategyResult found(std::string path) {
            return { Kind::Found, std::move(path), { }, { } };
        }

        [[nodiscard]] static StrategyResult notFound() {
            return { Kind::NotFound, { }, { }, { } };
        }

        [[nodiscard]] static StrategyResult probeError(std::string code, std::string message) {
            return { Kind::ProbeError, { }, std::move(code), std::move(message) };
        }

        [[nodiscard]] Kind getKind() const { return this->m_kind; }
        [[nodiscard]] bool isFound() const { return this->m_kind == Kind::Found; }

        [[nodiscard]] const std::string &getPath() const { return this->m_path; }
        [[nodiscard]] const std::string &getCode() const { return this->m_code; }
        [[nodiscard]] const std::string &getMessage() const { return this->m_message; }

    private:
        StrategyResult(Kind kind, std::string path, std::string code, std::string message)
            : m_kind(kind), m_path(std::move(path)), m_code(std::move(code)), m_message(std::move(message)) { }

        Kind m_kind;
        std::string m_path;
        std::string m_code, m_message;
    };

    class Strategy {
    public:
        explicit Strategy(std::string name) : m_name(std::move(name)) { }
        virtual ~Strategy() = default;

        [[nodiscard]] const std::string &getName() const {
            return this->m_name;
        }

        /**
         * @brief Tries to locate the file a reference refers to
         * @note May throw. The strategy chain turns exceptions into probe errors
         */
        [[nodiscard]] virtual StrategyResult probe(const api::ReferenceRequest &request, const ProbeContext &context) const = 0;

    private:
        std::string m_name;
    };

    /**
     * @brief Whether the reference text already names a binary module rather than an assembly
     */
    [[nodiscard]] bool isFileName(const std::string &text);

    /**
     * @brief The file name probed in directories: the text itself for file names, otherwise the simple assembly name with the default extension
     */
    [[nodiscard]] std::string getProbeFileName(const std::string &text);

}
