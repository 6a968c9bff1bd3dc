#include <rr/core/strategies/strategy_descriptor_load.hpp>

#include <wolv/utils/string.hpp>

#include <fmt/format.h>

namespace rr::core::strategies {

    DescriptorLoadStrategy::DescriptorLoadStrategy() : Strategy("descriptor load") { }

    StrategyResult DescriptorLoadStrategy::probe(const api::ReferenceRequest &request, const ProbeContext &context) const {
        // Only descriptors carry a comma, plain names and paths are left to the directory probes
        if (request.text.find(',') == std::string::npos)
            return StrategyResult::notFound();

        std::optional<std::fs::path> location;
        try {
            location = context.assemblyLoader.load(request.text);
        } catch (const std::exception &e) {
            context.console.debug(fmt::format("Loading '{}' failed: {}", request.text, e.what()));
            return StrategyResult::notFound();
        } catch (...) {
            context.console.debug(fmt::format("Loading '{}' failed", request.text));
            return StrategyResult::notFound();
        }

        if (!location.has_value() || location->empty())
            return StrategyResult::notFound();

        return StrategyResult::found(wolv::util::toUTF8String(*location));
    }

}
