#pragma once

#include <string>
#include <vector>

#include <rr/helpers/types.hpp>

namespace rr::hlp {

    [[nodiscard]] std::string toLower(std::string string);

    [[nodiscard]] bool equalsIgnoreCase(const std::string &left, const std::string &right);
    [[nodiscard]] bool endsWithIgnoreCase(const std::string &string, const std::string &suffix);

    // Lowercase hex digits, two per byte, no separators
    [[nodiscard]] std::string encodeHexString(const std::vector<u8> &bytes);

}
