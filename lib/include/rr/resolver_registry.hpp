#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <rr/resolver.hpp>
#include <rr/core/errors/result.hpp>
#include <rr/core/log_console.hpp>

namespace rr {

    /**
     * @brief Creates an externally provided resolver, e.g. one backed by an installed build tool of a certain version
     */
    class ResolverProvider {
    public:
        using Result  = hlp::Result<std::shared_ptr<Resolver>, std::string>;
        using Factory = std::function<Result()>;

        ResolverProvider(std::string versionKey, Factory factory) : m_versionKey(std::move(versionKey)), m_factory(std::move(factory)) { }

        [[nodiscard]] const std::string &getVersionKey() const {
            return this->m_versionKey;
        }

        /**
         * @brief Creates the resolver
         * @return The resolver, or the reasons it is not available. Never throws
         */
        [[nodiscard]] Result tryCreate() const;

    private:
        std::string m_versionKey;
        Factory m_factory;
    };

    class ResolverRegistry {
    public:
        void addProvider(ResolverProvider provider) {
            this->m_providers.push_back(std::move(provider));
        }

        [[nodiscard]] const std::vector<ResolverProvider> &getProviders() const {
            return this->m_providers;
        }

        /**
         * @brief Creates a resolver with the first provider registered for versionKey that succeeds
         * @return The resolver or nullptr if no provider for this version is available
         */
        [[nodiscard]] std::shared_ptr<Resolver> tryCreate(const std::string &versionKey, const core::LogConsole &console = { }) const;

        /**
         * @brief Registry of the providers known to this process. Hosts add their providers at startup
         */
        [[nodiscard]] static ResolverRegistry &getGlobal();

    private:
        std::vector<ResolverProvider> m_providers;
    };

    constexpr static auto DefaultExternalResolverVersion = "12";

    /**
     * @brief Picks the resolver to use
     * @param externalResolverEnabled Whether externally provided resolvers may be used at all
     * @param preferredVersion Version of the external resolver to try first, defaults to DefaultExternalResolverVersion
     * @param registry Providers to choose from
     * @param console Receives debug messages about unavailable providers
     * @return An external resolver if one is available, otherwise the builtin one. Never fails
     */
    [[nodiscard]] std::shared_ptr<Resolver> getDefaultResolver(
            bool externalResolverEnabled,
            const std::optional<std::string> &preferredVersion = std::nullopt,
            const ResolverRegistry &registry = ResolverRegistry::getGlobal(),
            const core::LogConsole &console = { });

}
