#pragma once

#include <rr/core/strategies/strategy.hpp>

namespace rr::core::strategies {

    /**
     * @brief Resolves rooted paths that point at an existing file, verbatim
     */
    class AbsolutePathStrategy final : public Strategy {
    public:
        AbsolutePathStrategy();

        [[nodiscard]] StrategyResult probe(const api::ReferenceRequest &request, const ProbeContext &context) const override;
    };

}
