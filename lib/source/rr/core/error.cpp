#include <rr/core/errors/error.hpp>

#include <fmt/format.h>

namespace rr::core::err::impl {

    std::string formatDiagnosticCode(char prefix, u32 errorCode) {
        return fmt::format("{}R{:03}", prefix, errorCode);
    }

    std::string formatDiagnostic(const std::string &title, const std::string &description) {
        if (description.empty())
            return title;

        return fmt::format("{} {}", title, description);
    }

}
