/**
 * @file uln.cpp
 * @brief Uln Value Object implementation
 */

#include "uln/domain/uln.h"
#include "uln/validation/uln_validator.h"

namespace uln {
namespace domain {

Uln Uln::fromString(const std::optional<std::string>& value) {
    return Uln(validation::requireValidUln(value));
}

int Uln::compareTo(const Uln& other) const noexcept {
    int result = value_.compare(other.value_);
    if (result < 0) {
        return -1;
    }
    return result > 0 ? 1 : 0;
}

std::string Uln::toString() const {
    return "ULN(" + value_ + ")";
}

std::ostream& operator<<(std::ostream& os, const Uln& uln) {
    return os << uln.toString();
}

} // namespace domain
} // namespace uln
