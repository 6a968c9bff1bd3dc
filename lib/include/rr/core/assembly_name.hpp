#pragma once

#include <optional>
#include <string>
#include <vector>

#include <rr/helpers/types.hpp>
#include <rr/core/errors/result.hpp>

namespace rr::core {

    /**
     * @brief Parsed form of a strong-name descriptor such as
     * "FSharp.Core, Version=4.4.0.0, Culture=neutral, PublicKeyToken=b03f5f7f11d50a3a"
     */
    class AssemblyName {
    public:
        using Result = hlp::Result<AssemblyName, std::string>;

        class Version {
        public:
            Version() = default;
            explicit Version(std::vector<u32> components) : m_components(std::move(components)) { }

            [[nodiscard]] const std::vector<u32> &getComponents() const { return this->m_components; }
            [[nodiscard]] std::string toString() const;

            bool operator==(const Version &other) const = default;

        private:
            std::vector<u32> m_components;
        };

        /**
         * @brief Parses a descriptor
         * @param descriptor Comma separated descriptor text
         * @return The parsed name or the reasons the descriptor is malformed
         */
        [[nodiscard]] static Result parse(const std::string &descriptor);

        [[nodiscard]] const std::string &getName() const { return this->m_name; }
        [[nodiscard]] const std::optional<Version> &getVersion() const { return this->m_version; }
        [[nodiscard]] const std::optional<std::string> &getCulture() const { return this->m_culture; }

        /// An empty token means the descriptor explicitly said "PublicKeyToken=null"
        [[nodiscard]] const std::optional<std::vector<u8>> &getPublicKeyToken() const { return this->m_publicKeyToken; }

        [[nodiscard]] std::string toString() const;

    private:
        AssemblyName() = default;

        std::string m_name;
        std::optional<Version> m_version;
        std::optional<std::string> m_culture;
        std::optional<std::vector<u8>> m_publicKeyToken;
    };

}
