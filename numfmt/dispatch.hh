#ifndef NUMFMT_DISPATCH_H
#define NUMFMT_DISPATCH_H

#include "numfmt/buffer_contract.hh"
#include "numfmt/byte_span.hh"
#include "numfmt/float_to_string.hh"
#include "numfmt/integer_to_string.hh"

#include <cstddef>

#include <stdint.h>

namespace numfmt {

/* Formatting algorithms.  Each has:
 *   static const std::size_t kMinimum;  // destination bytes required
 *   template <class T> static ByteSpan Format(T value, char *scratch);
 * Format may write anywhere in scratch[0, kMinimum).  The span it returns is
 * either at scratch or a static literal.
 */

// Shortest round trip with NaN and infinity as literals.
struct CheckedFloat {
  static const std::size_t kMinimum = kFloatBufferSize;

  template <class Float> static ByteSpan Format(Float value, char *scratch) {
    return ToStringChecked(value, scratch);
  }
};

// Shortest round trip for values the caller promises are finite.
struct FiniteFloat {
  static const std::size_t kMinimum = kFloatBufferSize;

  template <class Float> static ByteSpan Format(Float value, char *scratch) {
    return ByteSpan(scratch, ToString(value, scratch));
  }
};

struct Decimal {
  static const std::size_t kMinimum = kIntegerBufferSize;

  template <class Integer> static ByteSpan Format(Integer value, char *scratch) {
    return ByteSpan(scratch, ToString(value, scratch));
  }
};

// The algorithm used for a value type unless the caller asks for FiniteFloat.
template <class T> struct DefaultAlgorithm;
template <> struct DefaultAlgorithm<double> { typedef CheckedFloat Type; };
template <> struct DefaultAlgorithm<float> { typedef CheckedFloat Type; };
template <> struct DefaultAlgorithm<int64_t> { typedef Decimal Type; };
template <> struct DefaultAlgorithm<uint64_t> { typedef Decimal Type; };
template <> struct DefaultAlgorithm<int32_t> { typedef Decimal Type; };
template <> struct DefaultAlgorithm<uint32_t> { typedef Decimal Type; };

// Destination bytes Format(T, ...) requires.
template <class T> std::size_t MinimumSize() {
  return DefaultAlgorithm<T>::Type::kMinimum;
}

} // namespace numfmt

#endif // NUMFMT_DISPATCH_H
