#include <rr/helpers/utils.hpp>

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace rr::hlp {

    std::string toLower(std::string string) {
        std::transform(string.begin(), string.end(), string.begin(), [](unsigned char c) {
            return char(std::tolower(c));
        });

        return string;
    }

    bool equalsIgnoreCase(const std::string &left, const std::string &right) {
        return left.size() == right.size() && toLower(left) == toLower(right);
    }

    bool endsWithIgnoreCase(const std::string &string, const std::string &suffix) {
        if (suffix.size() > string.size())
            return false;

        return toLower(string.substr(string.size() - suffix.size())) == toLower(suffix);
    }

    std::string encodeHexString(const std::vector<u8> &bytes) {
        std::string result;
        result.reserve(bytes.size() * 2);

        for (u8 byte : bytes)
            result += fmt::format("{:02x}", byte);

        return result;
    }

}
