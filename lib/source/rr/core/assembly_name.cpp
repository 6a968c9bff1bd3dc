#include <rr/core/assembly_name.hpp>
#include <rr/helpers/utils.hpp>

#include <wolv/utils/string.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace rr::core {

    namespace {

        constexpr static u32 MaxVersionComponent = std::numeric_limits<u16>::max();
        constexpr static size_t PublicKeyTokenLength = 8;

        std::optional<AssemblyName::Version> parseVersion(const std::string &string) {
            const auto parts = wolv::util::splitString(string, ".");
            if (parts.size() < 2 || parts.size() > 4)
                return std::nullopt;

            std::vector<u32> components;
            for (const auto &part : parts) {
                if (part.empty() || !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); }))
                    return std::nullopt;

                u32 value = 0;
                const auto [end, error] = std::from_chars(part.data(), part.data() + part.size(), value);
                if (error != std::errc() || end != part.data() + part.size() || value > MaxVersionComponent)
                    return std::nullopt;

                components.push_back(value);
            }

            return AssemblyName::Version(std::move(components));
        }

        std::optional<std::vector<u8>> parsePublicKeyToken(const std::string &string) {
            if (hlp::equalsIgnoreCase(string, "null"))
                return std::vector<u8>{ };

            if (string.size() != PublicKeyTokenLength * 2)
                return std::nullopt;

            std::vector<u8> token;
            for (size_t i = 0; i < string.size(); i += 2) {
                u8 byte = 0;
                const auto [end, error] = std::from_chars(string.data() + i, string.data() + i + 2, byte, 16);
                if (error != std::errc() || end != string.data() + i + 2)
                    return std::nullopt;

                token.push_back(byte);
            }

            return token;
        }

    }

    std::string AssemblyName::Version::toString() const {
        return fmt::format("{}", fmt::join(this->m_components, "."));
    }

    AssemblyName::Result AssemblyName::parse(const std::string &descriptor) {
        const auto components = wolv::util::splitString(descriptor, ",");
        if (components.empty())
            return Result::err(fmt::format("Descriptor '{}' has no assembly name", descriptor));

        AssemblyName result;
        result.m_name = wolv::util::trim(components.front());

        if (result.m_name.empty())
            return Result::err(fmt::format("Descriptor '{}' has no assembly name", descriptor));
        if (result.m_name.find('=') != std::string::npos)
            return Result::err(fmt::format("Descriptor '{}' does not start with an assembly name", descriptor));

        std::vector<std::string> errors;
        for (size_t i = 1; i < components.size(); i++) {
            const auto &component = components[i];

            const auto separator = component.find('=');
            if (separator == std::string::npos) {
                errors.push_back(fmt::format("Component '{}' is not of the form Key=Value", wolv::util::trim(component)));
                continue;
            }

            const auto key   = hlp::toLower(wolv::util::trim(component.substr(0, separator)));
            const auto value = wolv::util::trim(component.substr(separator + 1));

            if (key == "version") {
                if (result.m_version.has_value())
                    errors.push_back("Version specified more than once");
                else if (auto version = parseVersion(value); version.has_value())
                    result.m_version = std::move(version);
                else
                    errors.push_back(fmt::format("Invalid version '{}'", value));
            } else if (key == "culture") {
                if (result.m_culture.has_value())
                    errors.push_back("Culture specified more than once");
                else
                    result.m_culture = value;
            } else if (key == "publickeytoken") {
                if (result.m_publicKeyToken.has_value())
                    errors.push_back("PublicKeyToken specified more than once");
                else if (auto token = parsePublicKeyToken(value); token.has_value())
                    result.m_publicKeyToken = std::move(token);
                else
                    errors.push_back(fmt::format("Invalid public key token '{}'", value));
            } else if (key.empty()) {
                errors.push_back(fmt::format("Component '{}' has no key", wolv::util::trim(component)));
            }
        }

        if (!errors.empty())
            return Result::err(errors);

        return Result::good(result);
    }

    std::string AssemblyName::toString() const {
        std::string result = this->m_name;

        if (this->m_version.has_value())
            result += fmt::format(", Version={}", this->m_version->toString());
        if (this->m_culture.has_value())
            result += fmt::format(", Culture={}", *this->m_culture);
        if (this->m_publicKeyToken.has_value())
            result += fmt::format(", PublicKeyToken={}", this->m_publicKeyToken->empty() ? "null" : hlp::encodeHexString(*this->m_publicKeyToken));

        return result;
    }

}
