#include <rr/resolver_registry.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rr {

    ResolverProvider::Result ResolverProvider::tryCreate() const {
        if (!this->m_factory)
            return Result::err(fmt::format("Provider for version {} has no factory", this->m_versionKey));

        try {
            auto result = this->m_factory();
            if (result.isOk() && result.unwrap() == nullptr)
                return Result::err(fmt::format("Provider for version {} returned no resolver", this->m_versionKey));

            return result;
        } catch (const std::exception &e) {
            return Result::err(fmt::format("Provider for version {} failed: {}", this->m_versionKey, e.what()));
        } catch (...) {
            return Result::err(fmt::format("Provider for version {} failed", this->m_versionKey));
        }
    }

    std::shared_ptr<Resolver> ResolverRegistry::tryCreate(const std::string &versionKey, const core::LogConsole &console) const {
        bool anyProvider = false;

        for (const auto &provider : this->m_providers) {
            if (provider.getVersionKey() != versionKey)
                continue;

            anyProvider = true;

            auto result = provider.tryCreate();
            if (result.isOk())
                return result.unwrap();

            console.debug(fmt::format("External resolver {} is not available: {}", versionKey, fmt::join(result.unwrapErrs(), ", ")));
        }

        if (!anyProvider)
            console.debug(fmt::format("No external resolver registered for version {}", versionKey));

        return nullptr;
    }

    ResolverRegistry &ResolverRegistry::getGlobal() {
        static ResolverRegistry registry;

        return registry;
    }

    std::shared_ptr<Resolver> getDefaultResolver(bool externalResolverEnabled, const std::optional<std::string> &preferredVersion, const ResolverRegistry &registry, const core::LogConsole &console) {
        const auto version = preferredVersion.value_or(DefaultExternalResolverVersion);

        if (externalResolverEnabled) {
            if (auto resolver = registry.tryCreate(version, console); resolver != nullptr)
                return resolver;

            if (version != DefaultExternalResolverVersion) {
                if (auto resolver = registry.tryCreate(DefaultExternalResolverVersion, console); resolver != nullptr)
                    return resolver;
            }
        }

        return std::make_shared<BuiltinResolver>();
    }

}
