#pragma once

#include <rr/core/strategies/strategy.hpp>

namespace rr::core::strategies {

    /**
     * @brief Probes every candidate directory in order for the reference's file name
     */
    class SearchPathStrategy final : public Strategy {
    public:
        SearchPathStrategy();

        [[nodiscard]] StrategyResult probe(const api::ReferenceRequest &request, const ProbeContext &context) const override;
    };

}
