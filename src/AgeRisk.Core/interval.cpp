#include "interval.h"
#include "string_util.h"

#include <string>

namespace agerisk::core {

DoubleInterval parse_double_interval(const std::string_view &value, const std::string_view delims) {
    auto parts = split_string(value, delims);
    if (parts.size() == 2) {
        try {
            double start = std::stod(std::string{parts[0]});
            double end = std::stod(std::string{parts[1]});
            return DoubleInterval(start, end);
        } catch (const std::logic_error &e) {
            throw InvalidInput(
                fmt::format("Failed to parse interval from value: '{}', {}", value, e.what()));
        }
    }

    throw InvalidInput(
        fmt::format("Input value:'{}' does not have the right format: xx-xx.", value));
}
} // namespace agerisk::core
