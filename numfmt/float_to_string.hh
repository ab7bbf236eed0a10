#ifndef NUMFMT_FLOAT_TO_STRING_H
#define NUMFMT_FLOAT_TO_STRING_H

// Just for ToStringBuf
#include "numfmt/integer_to_string.hh"
#include "numfmt/byte_span.hh"

namespace numfmt {

/* Longest text: sign, 17 significant digits, decimal point, 'e', exponent
 * sign and three exponent digits.  The same for float so every float entry
 * point shares one minimum.
 */
template <> struct ToStringBuf<double> {
  static const unsigned kBytes = 24;
};

template <> struct ToStringBuf<float> {
  static const unsigned kBytes = 24;
};

/* Shortest text that parses back to value, written at to.  Returns the end.
 *
 * Values with decimal exponent in [-5, 16) are positional and always have a
 * decimal point ("1.0", "0.00025", "-0.0").  Everything else is exponential
 * without a '+' or padding on the exponent ("1e16", "2.5e-7").
 *
 * Meant for finite values.  NaN and infinity print as "0.0".
 */
char *ToString(double value, char *to);
char *ToString(float value, char *to);

/* Same as ToString for finite values, which land at to.  NaN, inf and -inf
 * instead return the static literals "NaN", "inf" and "-inf" without
 * touching to.
 */
ByteSpan ToStringChecked(double value, char *to);
ByteSpan ToStringChecked(float value, char *to);

} // namespace numfmt

#endif // NUMFMT_FLOAT_TO_STRING_H
