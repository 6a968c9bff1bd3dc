#include <rr/core/strategy_chain.hpp>
#include <rr/core/errors/resolver_errors.hpp>

#include <fmt/format.h>

namespace rr::core {

    namespace {

        strategies::StrategyResult runStrategy(const strategies::Strategy &strategy, const api::ReferenceRequest &request, const strategies::ProbeContext &context) {
            try {
                return strategy.probe(request, context);
            } catch (const err::Diagnostic::Exception &e) {
                return strategies::StrategyResult::probeError(e.getCode(), e.getDescription());
            } catch (const std::exception &e) {
                return strategies::StrategyResult::probeError(err::SR001.getCode(), e.what());
            } catch (...) {
                return strategies::StrategyResult::probeError(err::SR001.getCode(), fmt::format("Unknown failure in {} strategy", strategy.getName()));
            }
        }

        std::string defaultToolTip(const std::string &, const std::string &defaultText) {
            return defaultText;
        }

    }

    std::optional<api::ResolvedReference> StrategyChain::resolve(const api::ReferenceRequest &request, const strategies::ProbeContext &context) const {
        context.console.debug(fmt::format("Resolving {}", request.text));

        for (const auto &strategy : this->m_strategies) {
            const auto result = runStrategy(*strategy, request, context);

            switch (result.getKind()) {
                using enum strategies::StrategyResult::Kind;

                case Found:
                    context.console.debug(fmt::format("Resolved {} --> {} ({})", request.text, result.getPath(), strategy->getName()));
                    return api::ResolvedReference { result.getPath(), request.baggage, defaultToolTip };
                case ProbeError:
                    context.console.warning(result.getCode(), result.getMessage());
                    break;
                case NotFound:
                    break;
            }
        }

        return std::nullopt;
    }

}
