#include "domain/Money.hpp"
#include "domain/Errors.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <iomanip>

namespace banking::domain {

namespace {

// Допуск на двоичное представление double (0.1 + 0.2 и т.п.)
constexpr double FRACTION_TOLERANCE = 1e-6;

} // namespace

Money Money::fromMinorUnits(int64_t minorUnits) {
    if (minorUnits < 0) {
        throw std::invalid_argument("Money cannot be negative: " + std::to_string(minorUnits));
    }
    return Money(minorUnits);
}

Money Money::fromDouble(double value) {
    if (!std::isfinite(value)) {
        throw ValidationError("amount must be a finite number");
    }
    if (value < 0) {
        throw ValidationError("amount cannot be negative");
    }

    double scaled = value * static_cast<double>(MINOR_UNITS_PER_UNIT);
    if (scaled >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        throw ValidationError("amount is too large");
    }

    double rounded = std::round(scaled);
    if (std::fabs(scaled - rounded) > FRACTION_TOLERANCE * static_cast<double>(MINOR_UNITS_PER_UNIT)) {
        throw ValidationError("amount must have at most 2 decimal places");
    }
    return Money(static_cast<int64_t>(rounded));
}

double Money::toDouble() const {
    return static_cast<double>(minorUnits_) / static_cast<double>(MINOR_UNITS_PER_UNIT);
}

std::string Money::toString() const {
    std::ostringstream ss;
    ss << (minorUnits_ / MINOR_UNITS_PER_UNIT) << "."
       << std::setw(2) << std::setfill('0') << (minorUnits_ % MINOR_UNITS_PER_UNIT);
    return ss.str();
}

Money Money::operator+(const Money& other) const {
    if (other.minorUnits_ > std::numeric_limits<int64_t>::max() - minorUnits_) {
        throw std::overflow_error("Money overflow: " + toString() + " + " + other.toString());
    }
    return Money(minorUnits_ + other.minorUnits_);
}

Money Money::operator-(const Money& other) const {
    if (other.minorUnits_ > minorUnits_) {
        throw NegativeBalanceError("Money cannot go negative: " + toString() + " - " + other.toString());
    }
    return Money(minorUnits_ - other.minorUnits_);
}

} // namespace banking::domain
