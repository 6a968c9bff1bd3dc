#pragma once

#include <optional>

#include <rr/api.hpp>
#include <rr/core/strategies.hpp>

namespace rr::core {

    /**
     * @brief Runs the resolution strategies for one reference until one of them finds a file
     */
    class StrategyChain {
    public:
        StrategyChain() : m_strategies(strategies::createStrategies()) { }

        /**
         * @brief Resolves a single reference
         * @return The resolved reference, or std::nullopt if every strategy came up empty. Never throws
         */
        [[nodiscard]] std::optional<api::ResolvedReference> resolve(const api::ReferenceRequest &request, const strategies::ProbeContext &context) const;

        [[nodiscard]] const strategies::StrategyArray &getStrategies() const {
            return this->m_strategies;
        }

    private:
        strategies::StrategyArray m_strategies;
    };

}
