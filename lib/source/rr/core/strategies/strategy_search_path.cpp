#include <rr/core/strategies/strategy_search_path.hpp>
#include <rr/core/errors/resolver_errors.hpp>

#include <wolv/utils/string.hpp>

#include <fmt/format.h>

namespace rr::core::strategies {

    SearchPathStrategy::SearchPathStrategy() : Strategy("search path") { }

    StrategyResult SearchPathStrategy::probe(const api::ReferenceRequest &request, const ProbeContext &context) const {
        const std::fs::path fileName(getProbeFileName(request.text));

        for (const auto &directory : context.searchPaths) {
            const auto trialPath = directory / fileName;

            // A directory that cannot be read only disqualifies itself
            try {
                if (context.fileSystem.fileExists(trialPath))
                    return StrategyResult::found(wolv::util::toUTF8String(trialPath));
            } catch (const err::Diagnostic::Exception &e) {
                context.console.warning(e);
            } catch (const std::exception &e) {
                context.console.warning(err::SR001.getCode(), e.what());
            } catch (...) {
                context.console.warning(err::SR001.getCode(), fmt::format("Unknown failure probing '{}'", wolv::util::toUTF8String(trialPath)));
            }
        }

        return StrategyResult::notFound();
    }

}
