#include <rr/core/strategies/strategy_versioned_core_library.hpp>
#include <rr/core/assembly_name.hpp>

#include <wolv/utils/string.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rr::core::strategies {

    VersionedCoreLibraryStrategy::VersionedCoreLibraryStrategy() : Strategy("versioned core library") { }

    StrategyResult VersionedCoreLibraryStrategy::probe(const api::ReferenceRequest &request, const ProbeContext &context) const {
        if (!request.text.starts_with(context.coreLibrary.name + ", Version="))
            return StrategyResult::notFound();

        if (!context.platform.isWindowsLike())
            return StrategyResult::notFound();

        const auto assemblyName = AssemblyName::parse(request.text);
        if (assemblyName.isErr()) {
            context.console.debug(fmt::format("'{}' is not a valid descriptor: {}", request.text, fmt::join(assemblyName.unwrapErrs(), ", ")));
            return StrategyResult::notFound();
        }

        const auto programFiles = context.platform.getProgramFilesDirectory();
        if (!programFiles.has_value())
            return StrategyResult::notFound();

        const auto &name = assemblyName.unwrap();
        const auto directory = *programFiles / context.coreLibrary.referenceDirectory / name.getVersion()->toString();
        const auto trialPath = directory / (name.getName() + AssemblyExtension);

        if (context.fileSystem.fileExists(trialPath))
            return StrategyResult::found(wolv::util::toUTF8String(trialPath));

        return StrategyResult::notFound();
    }

}
