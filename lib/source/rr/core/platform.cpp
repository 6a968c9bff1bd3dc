#include <rr/core/platform.hpp>
#include <rr/core/errors/resolver_errors.hpp>

#include <fmt/format.h>

#include <cstdlib>

#if defined(_WIN32)
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <windows.h>

    #include <iterator>
#endif

namespace rr::core {

#if defined(_WIN32)

    namespace {

        constexpr static auto FrameworkRegistryKey = L"Software\\Microsoft\\.NetFramework";

        class RegistryKey {
        public:
            RegistryKey(HKEY parent, const std::wstring &subKey) {
                if (parent == nullptr || ::RegOpenKeyExW(parent, subKey.c_str(), 0, KEY_READ, &this->m_key) != ERROR_SUCCESS)
                    this->m_key = nullptr;
            }

            ~RegistryKey() {
                if (this->m_key != nullptr)
                    ::RegCloseKey(this->m_key);
            }

            RegistryKey(const RegistryKey &) = delete;
            RegistryKey &operator=(const RegistryKey &) = delete;

            [[nodiscard]] bool isValid() const { return this->m_key != nullptr; }
            [[nodiscard]] HKEY get() const { return this->m_key; }

            [[nodiscard]] std::vector<std::wstring> getSubKeyNames() const {
                std::vector<std::wstring> result;

                for (DWORD index = 0;; index++) {
                    wchar_t name[256] = { };
                    DWORD nameSize = DWORD(std::size(name));

                    const auto status = ::RegEnumKeyExW(this->m_key, index, name, &nameSize, nullptr, nullptr, nullptr, nullptr);
                    if (status == ERROR_NO_MORE_ITEMS)
                        break;
                    if (status != ERROR_SUCCESS)
                        err::SR002.throwError(fmt::format("Enumerating registry sub keys failed with status {}", status));

                    result.emplace_back(name, nameSize);
                }

                return result;
            }

            [[nodiscard]] std::optional<std::wstring> getDefaultStringValue() const {
                DWORD type = 0, size = 0;
                if (::RegQueryValueExW(this->m_key, nullptr, nullptr, &type, nullptr, &size) != ERROR_SUCCESS || type != REG_SZ)
                    return std::nullopt;

                std::wstring value(size / sizeof(wchar_t), L'\0');
                if (::RegQueryValueExW(this->m_key, nullptr, nullptr, nullptr, reinterpret_cast<LPBYTE>(value.data()), &size) != ERROR_SUCCESS)
                    return std::nullopt;

                while (!value.empty() && value.back() == L'\0')
                    value.pop_back();

                return value;
            }

        private:
            HKEY m_key = nullptr;
        };

        void collectFolders(const RegistryKey &foldersKey, std::vector<std::fs::path> &result) {
            if (!foldersKey.isValid())
                return;

            for (const auto &folderName : foldersKey.getSubKeyNames()) {
                RegistryKey folderKey(foldersKey.get(), folderName);
                if (!folderKey.isValid())
                    continue;

                if (auto value = folderKey.getDefaultStringValue(); value.has_value())
                    result.emplace_back(*value);
            }
        }

    }

#endif

    std::optional<std::fs::path> Platform::getProgramFilesDirectory() const {
        if (auto programFiles = this->getEnvironmentVariable("ProgramFiles(x86)"); programFiles.has_value())
            return std::fs::path(*programFiles);

        // 32 bit hosts only have the native directory
        if (auto programFiles = this->getEnvironmentVariable("ProgramFiles"); programFiles.has_value())
            return std::fs::path(*programFiles);

        return std::nullopt;
    }

    bool HostPlatform::isWindowsLike() const {
        #if defined(_WIN32)
            return true;
        #else
            return false;
        #endif
    }

    std::optional<std::string> HostPlatform::getEnvironmentVariable(const std::string &name) const {
        const char *value = std::getenv(name.c_str());
        if (value == nullptr)
            return std::nullopt;

        return std::string(value);
    }

    std::vector<std::fs::path> HostPlatform::enumerateAssemblyFolders() const {
        std::vector<std::fs::path> result;

        #if defined(_WIN32)
            RegistryKey frameworkKey(HKEY_LOCAL_MACHINE, FrameworkRegistryKey);
            if (!frameworkKey.isValid())
                return result;

            for (const auto &versionName : frameworkKey.getSubKeyNames()) {
                RegistryKey versionKey(frameworkKey.get(), versionName);
                if (!versionKey.isValid())
                    continue;

                collectFolders(RegistryKey(versionKey.get(), L"AssemblyFoldersEx"), result);
            }

            collectFolders(RegistryKey(frameworkKey.get(), L"AssemblyFolders"), result);
        #endif

        return result;
    }

    std::optional<std::fs::path> HostPlatform::getRuntimeDirectory() const {
        #if defined(_WIN32)
            auto windowsDirectory = this->getEnvironmentVariable("WINDIR");
            if (!windowsDirectory.has_value())
                return std::nullopt;

            #if defined(_WIN64)
                return std::fs::path(*windowsDirectory) / "Microsoft.NET" / "Framework64" / "v4.0.30319";
            #else
                return std::fs::path(*windowsDirectory) / "Microsoft.NET" / "Framework" / "v4.0.30319";
            #endif
        #else
            return std::nullopt;
        #endif
    }

}
