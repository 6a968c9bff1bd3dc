#pragma once

#include <rr/core/log_console.hpp>
#include <rr/helpers/types.hpp>

#include <wolv/io/fs.hpp>

#include <functional>
#include <string>
#include <vector>

namespace rr::api {

    /**
     * @brief Describes in which situation references are being resolved.
     * Only influences which default directories a caller puts into the configuration, the resolution itself is identical
     */
    enum class ResolutionEnvironment {
        /// A script or source being compiled
        CompileTimeLike,
        /// A script or source being interpreted
        RuntimeLike,
        /// A script or source being edited
        DesignTimeLike
    };

    /**
     * @brief Produces the text shown when hovering a resolved reference
     * @param typeName Name of the type or assembly the tooltip is for
     * @param defaultText Text the caller would show if nothing better is known
     */
    using ToolTipFormatter = std::function<std::string(const std::string &typeName, const std::string &defaultText)>;

    struct ReferenceRequest {
        /// Path, file name or strong-name descriptor
        std::string text;
        /// Caller defined data, handed back unchanged with the result
        std::string baggage;
    };

    struct ResolvedReference {
        std::string path;
        std::string baggage;
        ToolTipFormatter prepareToolTip;
    };

    struct ResolutionConfig {
        ResolutionEnvironment environment = ResolutionEnvironment::CompileTimeLike;

        /// "v4.5.1"-style moniker
        std::string targetFrameworkVersion;
        std::vector<std::fs::path> targetFrameworkDirectories;
        std::string targetProcessorArchitecture;

        std::fs::path outputDirectory;
        std::fs::path coreLibraryDirectory;
        std::vector<std::fs::path> explicitIncludeDirectories;
        std::fs::path implicitIncludeDirectory;

        core::LogConsole::MessageCallback logMessage;
        core::LogConsole::DiagnosticCallback logWarning;
        core::LogConsole::DiagnosticCallback logError;
        core::LogConsole::Level logLevel = core::LogConsole::Level::Info;
    };

}
