#pragma once

#include <string>
#include <cstdint>

namespace banking::domain {

/**
 * @brief Неотрицательная денежная сумма с фиксированной точностью
 *
 * Хранится в минорных единицах (копейки, центы), 2 знака после запятой.
 * Отрицательное значение получить нельзя: конструктор и вычитание
 * бросают исключение вместо того, чтобы обрезать результат до нуля.
 *
 * @example
 * ```cpp
 * auto balance = Money::fromMinorUnits(10000);   // 100.00
 * auto amount = Money::fromDouble(50.25);
 * auto result = balance + amount;                // 150.25
 * balance - Money::fromDouble(200.0);            // NegativeBalanceError
 * ```
 */
class Money {
public:
    static constexpr int64_t MINOR_UNITS_PER_UNIT = 100;

    Money() = default;

    /**
     * @brief Создать сумму из минорных единиц
     * @throws std::invalid_argument если minorUnits < 0
     */
    static Money fromMinorUnits(int64_t minorUnits);

    /**
     * @brief Создать сумму из десятичного числа (JSON number)
     *
     * Допускается не более 2 знаков после запятой.
     * @throws ValidationError если значение отрицательное, не конечное,
     *         слишком большое или имеет больше 2 знаков после запятой
     */
    static Money fromDouble(double value);

    static Money zero() { return Money(); }

    int64_t minorUnits() const { return minorUnits_; }
    double toDouble() const;
    bool isZero() const { return minorUnits_ == 0; }

    /// "150.00"
    std::string toString() const;

    /// @throws std::overflow_error
    Money operator+(const Money& other) const;

    /// @throws NegativeBalanceError если other > *this
    Money operator-(const Money& other) const;

    bool operator==(const Money& other) const { return minorUnits_ == other.minorUnits_; }
    bool operator!=(const Money& other) const { return minorUnits_ != other.minorUnits_; }
    bool operator<(const Money& other) const { return minorUnits_ < other.minorUnits_; }
    bool operator<=(const Money& other) const { return minorUnits_ <= other.minorUnits_; }
    bool operator>(const Money& other) const { return minorUnits_ > other.minorUnits_; }
    bool operator>=(const Money& other) const { return minorUnits_ >= other.minorUnits_; }

private:
    explicit Money(int64_t minorUnits) : minorUnits_(minorUnits) {}

    int64_t minorUnits_ = 0;
};

} // namespace banking::domain
