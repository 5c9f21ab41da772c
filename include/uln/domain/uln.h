/**
 * @file uln.h
 * @brief Value Object for a UK Unique Learner Number
 */

#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace uln {
namespace domain {

/**
 * @brief Unique Learner Number Value Object
 *
 * Holds a 10-digit ULN that has passed format and checksum validation.
 * The only way to obtain an instance is Uln::fromString(), so every Uln in
 * existence is valid. Instances are immutable and cheap to copy.
 *
 * @see https://www.gov.uk/education/learning-records-service-lrs
 */
class Uln {
private:
    std::string value_;

    explicit Uln(std::string value) : value_(std::move(value)) {}

public:
    /**
     * @brief Create Uln from string
     * @param value 10-digit ULN
     * @throws exception::NullInputException if value is absent
     * @throws exception::InvalidValueException if value is not a valid ULN
     */
    static Uln fromString(const std::optional<std::string>& value);

    [[nodiscard]] const std::string& getValue() const noexcept {
        return value_;
    }

    /**
     * @brief Compare against a possibly absent Uln
     * @return false when other is absent
     */
    [[nodiscard]] bool equals(const std::optional<Uln>& other) const noexcept {
        return other.has_value() && *this == *other;
    }

    /**
     * @brief Three-way comparison of the digit strings
     * @return -1, 0 or 1
     */
    [[nodiscard]] int compareTo(const Uln& other) const noexcept;

    bool operator==(const Uln& other) const noexcept {
        return value_ == other.value_;
    }

    bool operator!=(const Uln& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Uln& other) const noexcept {
        return value_ < other.value_;
    }

    bool operator>(const Uln& other) const noexcept {
        return other < *this;
    }

    bool operator<=(const Uln& other) const noexcept {
        return !(other < *this);
    }

    bool operator>=(const Uln& other) const noexcept {
        return !(*this < other);
    }

    /**
     * @brief Render as "ULN(0000000042)"
     */
    [[nodiscard]] std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const Uln& uln);

} // namespace domain
} // namespace uln

// Hash specialization for Uln
namespace std {
    template<>
    struct hash<uln::domain::Uln> {
        size_t operator()(const uln::domain::Uln& uln) const {
            return hash<string>()(uln.getValue());
        }
    };
}
