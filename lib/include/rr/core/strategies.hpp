#pragma once

#include <rr/core/strategies/strategy.hpp>
#include <rr/core/strategies/strategy_absolute_path.hpp>
#include <rr/core/strategies/strategy_versioned_core_library.hpp>
#include <rr/core/strategies/strategy_descriptor_load.hpp>
#include <rr/core/strategies/strategy_search_path.hpp>
#include <rr/core/strategies/strategy_shared_cache.hpp>

#include <array>
#include <memory>
#include <tuple>

namespace rr::core::strategies {

    // Resolution strategies in the order they are tried. The first one that finds a file wins
    using Strategies = std::tuple<
            AbsolutePathStrategy,
            VersionedCoreLibraryStrategy,
            DescriptorLoadStrategy,
            SearchPathStrategy,
            SharedCacheStrategy
    >;

    using StrategyArray = std::array<std::unique_ptr<Strategy>, std::tuple_size_v<Strategies>>;

    template<size_t N = 0>
    auto createStrategies(StrategyArray &&result = {}) {
        auto strategy = std::unique_ptr<Strategy>(new typename std::tuple_element<N, Strategies>::type());

        result[N] = std::move(strategy);

        if constexpr (N + 1 < std::tuple_size_v<Strategies>) {
            return createStrategies<N + 1>(std::move(result));
        } else {
            return result;
        }
    }

}
