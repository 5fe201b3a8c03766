#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace agerisk::core {

std::string trim(std::string value) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!value.empty() && is_space(value.back())) {
        value.pop_back();
    }

    std::size_t pos = 0;
    while (pos < value.size() && is_space(value[pos])) {
        ++pos;
    }

    return value.substr(pos);
}

std::vector<std::string_view> split_string(const std::string_view &value,
                                           std::string_view delims) noexcept {
    std::vector<std::string_view> output;
    size_t first = 0;

    while (first < value.size()) {
        const auto second = value.find_first_of(delims, first);
        if (first != second) {
            output.emplace_back(value.substr(first, second - first));
        }

        if (second == std::string_view::npos) {
            break;
        }

        first = second + 1;
    }

    return output;
}

bool case_insensitive::equals(const std::string_view &left,
                              const std::string_view &right) noexcept {
    return left.size() == right.size() &&
           std::equal(left.cbegin(), left.cend(), right.cbegin(), right.cend(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

} // namespace agerisk::core
