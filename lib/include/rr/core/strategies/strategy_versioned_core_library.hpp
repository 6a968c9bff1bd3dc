#pragma once

#include <rr/core/strategies/strategy.hpp>

namespace rr::core::strategies {

    /**
     * @brief Finds an exact version of the core library in its reference assembly directory without loading anything
     */
    class VersionedCoreLibraryStrategy final : public Strategy {
    public:
        VersionedCoreLibraryStrategy();

        [[nodiscard]] StrategyResult probe(const api::ReferenceRequest &request, const ProbeContext &context) const override;
    };

}
