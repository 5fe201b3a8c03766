#include "exception.h"

#include <fmt/format.h>

namespace agerisk::core {

AgeRiskException::AgeRiskException(const std::string &what_arg, const source_location location)
    : std::runtime_error{what_arg}, location_{location} {
    what_arg_ = fmt::format("{}:{}: {}", file_name(), line(), std::runtime_error::what());
}

const char *AgeRiskException::what() const noexcept { return what_arg_.c_str(); }

std::uint_least32_t AgeRiskException::line() const noexcept { return location_.line(); }

const char *AgeRiskException::file_name() const noexcept { return location_.file_name(); }

const char *AgeRiskException::function_name() const noexcept {
    return location_.function_name();
}

} // namespace agerisk::core
