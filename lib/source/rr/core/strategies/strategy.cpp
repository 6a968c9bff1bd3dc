#include <rr/core/strategies/strategy.hpp>
#include <rr/core/assembly_name.hpp>
#include <rr/helpers/utils.hpp>

namespace rr::core::strategies {

    bool isFileName(const std::string &text) {
        return hlp::endsWithIgnoreCase(text, AssemblyExtension) || hlp::endsWithIgnoreCase(text, ExecutableExtension);
    }

    std::string getProbeFileName(const std::string &text) {
        if (isFileName(text))
            return text;

        if (const auto name = AssemblyName::parse(text); name.isOk())
            return name.unwrap().getName() + AssemblyExtension;
        else
            return text + AssemblyExtension;
    }

}
