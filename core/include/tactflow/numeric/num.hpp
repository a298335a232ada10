// tactflow/numeric/num.hpp - Extended integers (exact big integers and +/-infinity)
#pragma once

#include <gmpxx.h>

#include <cstdint>
#include <initializer_list>
#include <string>

namespace tactflow
{

/**
 * An exact integer or one of the two signed infinities.
 *
 * Values are immutable. Finite values are backed by GMP so arithmetic never
 * overflows; contract integers are 257-bit and cannot be held in a machine
 * word.
 */
class Num
{
public:
  enum class Kind : uint8_t {
    Integer,
    PosInf,
    NegInf,
  };

  /// Zero
  Num() = default;

  [[nodiscard]] static Num integer(mpz_class value);
  [[nodiscard]] static Num integer(long value);
  [[nodiscard]] static Num pos_inf();
  [[nodiscard]] static Num neg_inf();

  /// Parse a decimal or 0x-prefixed literal; throws ExecutionError if malformed
  [[nodiscard]] static Num parse(const std::string & literal);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_integer() const noexcept { return kind_ == Kind::Integer; }
  [[nodiscard]] bool is_pos_inf() const noexcept { return kind_ == Kind::PosInf; }
  [[nodiscard]] bool is_neg_inf() const noexcept { return kind_ == Kind::NegInf; }
  [[nodiscard]] bool is_infinite() const noexcept { return kind_ != Kind::Integer; }
  [[nodiscard]] bool is_zero() const noexcept;

  /// -1, 0 or 1
  [[nodiscard]] int sign() const noexcept;

  /// Finite value; throws ExecutionError for an infinity
  [[nodiscard]] const mpz_class & value() const;

  // ===========================================================================
  // Arithmetic
  // ===========================================================================

  /// Throws ExecutionError for (+inf) + (-inf)
  [[nodiscard]] Num add(const Num & other) const;

  [[nodiscard]] Num negate() const;

  /// 0 * inf is 0
  [[nodiscard]] Num multiply(const Num & other) const;

  /**
   * Truncating division. Throws ExecutionError on a zero divisor.
   *
   * A finite value divided by an infinity is 0. An infinity divided by a
   * finite value keeps or flips its sign. inf / inf is 1 for equal signs
   * and -1 otherwise.
   */
  [[nodiscard]] Num divide(const Num & other) const;

  // ===========================================================================
  // Ordering
  // ===========================================================================

  /// Negative, zero or positive as this is less than, equal to or greater than `other`
  [[nodiscard]] int compare(const Num & other) const noexcept;

  [[nodiscard]] static Num min(std::initializer_list<Num> nums);
  [[nodiscard]] static Num max(std::initializer_list<Num> nums);

  /// "+inf", "-inf" or the decimal value
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Num & a, const Num & b) noexcept { return a.compare(b) == 0; }
  friend bool operator!=(const Num & a, const Num & b) noexcept { return a.compare(b) != 0; }
  friend bool operator<(const Num & a, const Num & b) noexcept { return a.compare(b) < 0; }
  friend bool operator<=(const Num & a, const Num & b) noexcept { return a.compare(b) <= 0; }
  friend bool operator>(const Num & a, const Num & b) noexcept { return a.compare(b) > 0; }
  friend bool operator>=(const Num & a, const Num & b) noexcept { return a.compare(b) >= 0; }

private:
  Num(Kind kind, mpz_class value) : kind_(kind), value_(std::move(value)) {}

  Kind kind_ = Kind::Integer;
  mpz_class value_;
};

}  // namespace tactflow
