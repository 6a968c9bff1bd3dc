#include <rr.hpp>

#include <fmt/format.h>

#include <map>

const static std::map<rr::core::LogConsole::Level, std::string> LogLevels = {
        { rr::core::LogConsole::Level::Debug,     "Debug"     },
        { rr::core::LogConsole::Level::Info,      "Info"      },
        { rr::core::LogConsole::Level::Warning,   "Warning"   },
        { rr::core::LogConsole::Level::Error,     "Error"     }
};

int main() {
    // Pick a resolver. Without registered external providers this is always the builtin one
    auto resolver = rr::getDefaultResolver(true);
    fmt::print("Using resolver '{}'\n", resolver->getName());

    // Tell the resolver where to look and where to report to
    rr::api::ResolutionConfig config;
    config.environment              = rr::api::ResolutionEnvironment::RuntimeLike;
    config.targetFrameworkVersion   = resolver->getHighestInstalledFrameworkVersion();
    config.explicitIncludeDirectories = { std::fs::current_path() };
    config.implicitIncludeDirectory = std::fs::current_path();
    config.logLevel                 = rr::core::LogConsole::Level::Debug;

    config.logMessage = [](const std::string &message) {
        fmt::print("[{}] {}\n", LogLevels.at(rr::core::LogConsole::Level::Info), message);
    };
    config.logWarning = [](const std::string &code, const std::string &message) {
        fmt::print("[{}] {} {}\n", LogLevels.at(rr::core::LogConsole::Level::Warning), code, message);
    };
    config.logError = [](const std::string &code, const std::string &message) {
        fmt::print("[{}] {} {}\n", LogLevels.at(rr::core::LogConsole::Level::Error), code, message);
    };

    // Resolve a mix of file names and descriptors
    const std::vector<rr::api::ReferenceRequest> references = {
        { "System",                                                                             "system"    },
        { "mscorlib.dll",                                                                       "mscorlib"  },
        { "FSharp.Core, Version=4.4.0.0, Culture=neutral, PublicKeyToken=b03f5f7f11d50a3a",     "core"      },
        { "EventViewer, Version=6.3.0.0, Culture=neutral, PublicKeyToken=31bf3856ad364e35",     "viewer"    }
    };

    for (const auto &reference : resolver->resolve(config, references))
        fmt::print("{} -> {} ({})\n", reference.baggage, reference.path, reference.prepareToolTip("", reference.path));
}
