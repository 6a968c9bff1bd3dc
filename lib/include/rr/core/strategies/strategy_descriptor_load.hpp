#pragma once

#include <rr/core/strategies/strategy.hpp>

namespace rr::core::strategies {

    /**
     * @brief Asks the host runtime to load a strong-name descriptor and uses the location it was loaded from
     */
    class DescriptorLoadStrategy final : public Strategy {
    public:
        DescriptorLoadStrategy();

        [[nodiscard]] StrategyResult probe(const api::ReferenceRequest &request, const ProbeContext &context) const override;
    };

}
