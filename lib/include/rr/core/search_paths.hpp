#pragma once

#include <vector>

#include <rr/api.hpp>
#include <rr/core/log_console.hpp>
#include <rr/core/platform.hpp>

#include <wolv/io/fs.hpp>

namespace rr::core {

    /**
     * @brief Builds the ordered list of directories the search path strategy probes
     *
     * Order: target framework directories, explicit include directories, core library directory,
     * implicit include directory and finally the assembly folders registered with a Windows-like platform.
     */
    class SearchPathBuilder {
    public:
        SearchPathBuilder(const api::ResolutionConfig &config, const Platform *platform) : m_config(config), m_platform(platform) { }

        /**
         * @brief Builds the list. Never fails, a platform that cannot enumerate its folders contributes nothing
         * @param console Console that receives a warning if platform discovery fails
         */
        [[nodiscard]] std::vector<std::fs::path> build(const LogConsole &console) const;

    private:
        const api::ResolutionConfig &m_config;
        const Platform *m_platform;
    };

}
