// tactflow/numeric/num.cpp - Extended integer arithmetic
#include "tactflow/numeric/num.hpp"

#include "tactflow/basic/exceptions.hpp"

namespace tactflow
{

Num Num::integer(mpz_class value) { return Num(Kind::Integer, std::move(value)); }

Num Num::integer(long value) { return Num(Kind::Integer, mpz_class(value)); }

Num Num::pos_inf() { return Num(Kind::PosInf, mpz_class(0)); }

Num Num::neg_inf() { return Num(Kind::NegInf, mpz_class(0)); }

Num Num::parse(const std::string & literal)
{
  std::string digits = literal;
  bool negative = false;
  if (!digits.empty() && digits.front() == '-') {
    negative = true;
    digits.erase(0, 1);
  }

  int base = 10;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    base = 16;
    digits.erase(0, 2);
  } else if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'b' || digits[1] == 'B')) {
    base = 2;
    digits.erase(0, 2);
  } else if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'o' || digits[1] == 'O')) {
    base = 8;
    digits.erase(0, 2);
  }

  // Numeric separators are allowed in literals: 1_000_000
  std::string cleaned;
  cleaned.reserve(digits.size());
  for (const char c : digits) {
    if (c != '_') cleaned += c;
  }

  mpz_class value;
  if (cleaned.empty() || value.set_str(cleaned, base) != 0) {
    throw ExecutionError("malformed integer literal '" + literal + "'");
  }
  if (negative) {
    value = -value;
  }
  return integer(std::move(value));
}

bool Num::is_zero() const noexcept { return kind_ == Kind::Integer && sgn(value_) == 0; }

int Num::sign() const noexcept
{
  switch (kind_) {
    case Kind::PosInf:
      return 1;
    case Kind::NegInf:
      return -1;
    case Kind::Integer:
      break;
  }
  return sgn(value_);
}

const mpz_class & Num::value() const
{
  if (kind_ != Kind::Integer) {
    throw ExecutionError("no finite value for " + to_string());
  }
  return value_;
}

Num Num::add(const Num & other) const
{
  if (is_integer() && other.is_integer()) {
    return integer(value_ + other.value_);
  }
  if ((is_pos_inf() && other.is_neg_inf()) || (is_neg_inf() && other.is_pos_inf())) {
    throw ExecutionError("cannot add +inf and -inf");
  }
  if (is_pos_inf() || other.is_pos_inf()) {
    return pos_inf();
  }
  return neg_inf();
}

Num Num::negate() const
{
  switch (kind_) {
    case Kind::PosInf:
      return neg_inf();
    case Kind::NegInf:
      return pos_inf();
    case Kind::Integer:
      break;
  }
  return integer(-value_);
}

Num Num::multiply(const Num & other) const
{
  if (is_integer() && other.is_integer()) {
    return integer(value_ * other.value_);
  }
  if (is_zero() || other.is_zero()) {
    return integer(0L);
  }
  return (sign() * other.sign() > 0) ? pos_inf() : neg_inf();
}

Num Num::divide(const Num & other) const
{
  if (other.is_zero()) {
    throw ExecutionError("division by zero");
  }
  if (is_integer() && other.is_integer()) {
    // mpz_class operator/ truncates toward zero
    return integer(value_ / other.value_);
  }
  if (is_integer()) {
    return integer(0L);
  }
  if (other.is_integer()) {
    return (other.sign() > 0) ? *this : negate();
  }
  return integer(kind_ == other.kind_ ? 1L : -1L);
}

int Num::compare(const Num & other) const noexcept
{
  if (is_integer() && other.is_integer()) {
    const int c = cmp(value_, other.value_);
    return (c > 0) - (c < 0);
  }
  if (kind_ == other.kind_) {
    return 0;
  }
  if (is_neg_inf() || other.is_pos_inf()) {
    return -1;
  }
  return 1;
}

Num Num::min(std::initializer_list<Num> nums)
{
  if (nums.size() == 0) {
    throw ExecutionError("min of no values");
  }
  const Num * best = nums.begin();
  for (const Num & n : nums) {
    if (n.compare(*best) < 0) best = &n;
  }
  return *best;
}

Num Num::max(std::initializer_list<Num> nums)
{
  if (nums.size() == 0) {
    throw ExecutionError("max of no values");
  }
  const Num * best = nums.begin();
  for (const Num & n : nums) {
    if (n.compare(*best) > 0) best = &n;
  }
  return *best;
}

std::string Num::to_string() const
{
  switch (kind_) {
    case Kind::PosInf:
      return "+inf";
    case Kind::NegInf:
      return "-inf";
    case Kind::Integer:
      break;
  }
  return value_.get_str();
}

}  // namespace tactflow
