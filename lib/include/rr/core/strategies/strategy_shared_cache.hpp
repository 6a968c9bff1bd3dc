#pragma once

#include <rr/core/strategies/strategy.hpp>

namespace rr::core::strategies {

    /**
     * @brief Looks the reference up in the platform's shared assembly cache by name, version and public key token
     */
    class SharedCacheStrategy final : public Strategy {
    public:
        SharedCacheStrategy();

        [[nodiscard]] StrategyResult probe(const api::ReferenceRequest &request, const ProbeContext &context) const override;
    };

}
