#include <rr/core/strategies/strategy_absolute_path.hpp>

namespace rr::core::strategies {

    AbsolutePathStrategy::AbsolutePathStrategy() : Strategy("absolute path") { }

    StrategyResult AbsolutePathStrategy::probe(const api::ReferenceRequest &request, const ProbeContext &context) const {
        const std::fs::path path(request.text);

        if (!path.has_root_path())
            return StrategyResult::notFound();

        if (context.fileSystem.fileExists(path))
            return StrategyResult::found(request.text);

        return StrategyResult::notFound();
    }

}
