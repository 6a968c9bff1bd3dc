#include <rr/core/strategies/strategy_shared_cache.hpp>
#include <rr/core/assembly_name.hpp>
#include <rr/helpers/utils.hpp>

#include <wolv/utils/string.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rr::core::strategies {

    namespace {

        // <windows>\Microsoft.NET\Framework64\v4.0.30319 -> <windows>\Microsoft.NET\assembly
        std::fs::path getCacheRoot(std::fs::path runtimeDirectory) {
            if (!runtimeDirectory.has_filename())
                runtimeDirectory = runtimeDirectory.parent_path();

            return runtimeDirectory.parent_path().parent_path() / "assembly";
        }

    }

    SharedCacheStrategy::SharedCacheStrategy() : Strategy("shared cache") { }

    StrategyResult SharedCacheStrategy::probe(const api::ReferenceRequest &request, const ProbeContext &context) const {
        if (!context.platform.isWindowsLike() || isFileName(request.text))
            return StrategyResult::notFound();

        const auto assemblyName = AssemblyName::parse(request.text);
        if (assemblyName.isErr()) {
            context.console.debug(fmt::format("'{}' is not a valid descriptor: {}", request.text, fmt::join(assemblyName.unwrapErrs(), ", ")));
            return StrategyResult::notFound();
        }

        const auto &name = assemblyName.unwrap();
        if (!name.getVersion().has_value() || !name.getPublicKeyToken().has_value())
            return StrategyResult::notFound();

        const auto runtimeDirectory = context.platform.getRuntimeDirectory();
        if (!runtimeDirectory.has_value())
            return StrategyResult::notFound();

        const auto versionDirectoryName = fmt::format("v4.0_{}__{}", name.getVersion()->toString(), hlp::encodeHexString(*name.getPublicKeyToken()));
        const std::fs::path fileName(getProbeFileName(request.text));

        // One directory per processor architecture, e.g. GAC_32, GAC_64 and GAC_MSIL
        for (const auto &cacheDirectory : context.fileSystem.listDirectories(getCacheRoot(*runtimeDirectory))) {
            const auto assemblyDirectory = cacheDirectory / name.getName();
            if (!context.fileSystem.directoryExists(assemblyDirectory))
                continue;

            const auto versionDirectory = assemblyDirectory / versionDirectoryName;
            context.console.debug(fmt::format("Searching shared cache: {}", wolv::util::toUTF8String(versionDirectory)));

            if (!context.fileSystem.directoryExists(versionDirectory))
                continue;

            const auto trialPath = versionDirectory / fileName;
            if (context.fileSystem.fileExists(trialPath))
                return StrategyResult::found(wolv::util::toUTF8String(trialPath));
        }

        return StrategyResult::notFound();
    }

}
