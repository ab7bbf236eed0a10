#include "numfmt/float_to_string.hh"

#include <double-conversion/double-conversion.h>

#include <cmath>
#include <cstring>

namespace numfmt {
namespace {

using double_conversion::DoubleToStringConverter;

// Decimal exponents in [kPositionalLow, kPositionalHigh) print positionally.
const int kPositionalLow = -5;
const int kPositionalHigh = 16;

// DoubleToAscii wants room for the digits and a null.
const int kDigitBytes = DoubleToStringConverter::kBase10MaximalLength + 1;

// "inf" is the last three characters.
const char kNegativeInfinity[] = "-inf";
const char kNaN[] = "NaN";

/* digits[0, length) holds the shortest digits with the decimal point
 * point places from their start.  Rearrange them in place into text that
 * starts at digits and return its end.  Every move is a memmove because
 * source and destination overlap.
 */
char *LayoutDigits(char *digits, int length, int point) {
  const int exponent = point - 1;
  if (exponent < kPositionalLow || exponent >= kPositionalHigh) {
    char *out = digits + 1;
    if (length > 1) {
      std::memmove(digits + 2, digits + 1, length - 1);
      digits[1] = '.';
      out = digits + length + 1;
    }
    *out++ = 'e';
    if (exponent < 0) {
      *out++ = '-';
      return ToString(static_cast<uint32_t>(-exponent), out);
    }
    return ToString(static_cast<uint32_t>(exponent), out);
  }
  if (point <= 0) {
    // 0.000ddd
    const int zeros = -point;
    std::memmove(digits + 2 + zeros, digits, length);
    digits[0] = '0';
    digits[1] = '.';
    std::memset(digits + 2, '0', zeros);
    return digits + 2 + zeros + length;
  }
  if (point < length) {
    std::memmove(digits + point + 1, digits + point, length - point);
    digits[point] = '.';
    return digits + length + 1;
  }
  // Integer valued: pad to the decimal point then append ".0".
  std::memset(digits + length, '0', point - length);
  char *out = digits + point;
  *out++ = '.';
  *out++ = '0';
  return out;
}

template <class Float> char *ShortestToString(Float value, DoubleToStringConverter::DtoaMode mode, char *to) {
  // DoubleToAscii only accepts finite input.
  if (!std::isfinite(value)) value = 0;
  // Sign first so the digits can be generated where they will stay.  This
  // also puts a '-' on negative zero.
  char *digits = to;
  if (std::signbit(value)) *digits++ = '-';
  bool sign;
  int length, point;
  DoubleToStringConverter::DoubleToAscii(static_cast<double>(value), mode, 0, digits, kDigitBytes, &sign, &length, &point);
  return LayoutDigits(digits, length, point);
}

template <class Float> ByteSpan CheckedToString(Float value, char *to) {
  if (std::isnan(value)) return ByteSpan(kNaN, 3);
  if (std::isinf(value)) {
    return value < 0 ? ByteSpan(kNegativeInfinity, 4) : ByteSpan(kNegativeInfinity + 1, 3);
  }
  return ByteSpan(to, ToString(value, to));
}

} // namespace

char *ToString(double value, char *to) {
  return ShortestToString(value, DoubleToStringConverter::SHORTEST, to);
}

char *ToString(float value, char *to) {
  return ShortestToString(value, DoubleToStringConverter::SHORTEST_SINGLE, to);
}

ByteSpan ToStringChecked(double value, char *to) {
  return CheckedToString(value, to);
}

ByteSpan ToStringChecked(float value, char *to) {
  return CheckedToString(value, to);
}

} // namespace numfmt
