#include <rr/core/search_paths.hpp>
#include <rr/core/errors/resolver_errors.hpp>

namespace rr::core {

    std::vector<std::fs::path> SearchPathBuilder::build(const LogConsole &console) const {
        std::vector<std::fs::path> result;

        result.insert(result.end(), this->m_config.targetFrameworkDirectories.begin(), this->m_config.targetFrameworkDirectories.end());
        result.insert(result.end(), this->m_config.explicitIncludeDirectories.begin(), this->m_config.explicitIncludeDirectories.end());
        result.push_back(this->m_config.coreLibraryDirectory);
        result.push_back(this->m_config.implicitIncludeDirectory);

        if (this->m_platform == nullptr || !this->m_platform->isWindowsLike())
            return result;

        try {
            auto folders = this->m_platform->enumerateAssemblyFolders();
            result.insert(result.end(), folders.begin(), folders.end());
        } catch (const err::Diagnostic::Exception &e) {
            console.warning(e);
        } catch (const std::exception &e) {
            console.warning(err::SR002.getCode(), e.what());
        } catch (...) {
            console.warning(err::SR002.getCode(), "Unknown failure enumerating assembly folders");
        }

        return result;
    }

}
