#include "numfmt/integer_to_string.hh"

namespace numfmt {
namespace {

// Two digits per entry: kDigitPairs[2 * i], kDigitPairs[2 * i + 1] spell i.
const char kDigitPairs[200] = {
  '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
  '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
  '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
  '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
  '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
  '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
  '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
  '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
  '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
  '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9'
};

// Number of decimal digits in value.  Zero has one digit.
template <class Unsigned> unsigned DigitCount(Unsigned value) {
  unsigned count = 1;
  for (;;) {
    if (value < 10) return count;
    if (value < 100) return count + 1;
    if (value < 1000) return count + 2;
    if (value < 10000) return count + 3;
    value /= static_cast<Unsigned>(10000);
    count += 4;
  }
}

/* The digit count is known up front so the text is written back to front
 * ending exactly where the caller will look for it.  The output starts at to.
 */
template <class Unsigned> char *UnsignedToString(Unsigned value, char *to) {
  char *const end = to + DigitCount(value);
  char *out = end;
  while (value >= 100) {
    const unsigned pair = static_cast<unsigned>(value % 100) * 2;
    value /= 100;
    *--out = kDigitPairs[pair + 1];
    *--out = kDigitPairs[pair];
  }
  if (value < 10) {
    *--out = static_cast<char>('0' + value);
  } else {
    const unsigned pair = static_cast<unsigned>(value) * 2;
    *--out = kDigitPairs[pair + 1];
    *--out = kDigitPairs[pair];
  }
  return end;
}

// Negate in the unsigned domain so the most negative value has no overflow.
template <class Signed, class Unsigned> char *SignedToString(Signed value, char *to) {
  if (value < 0) {
    *to++ = '-';
    return UnsignedToString<Unsigned>(static_cast<Unsigned>(0) - static_cast<Unsigned>(value), to);
  }
  return UnsignedToString<Unsigned>(static_cast<Unsigned>(value), to);
}

} // namespace

char *ToString(uint64_t value, char *to) {
  return UnsignedToString<uint64_t>(value, to);
}

char *ToString(int64_t value, char *to) {
  return SignedToString<int64_t, uint64_t>(value, to);
}

char *ToString(uint32_t value, char *to) {
  return UnsignedToString<uint32_t>(value, to);
}

char *ToString(int32_t value, char *to) {
  return SignedToString<int32_t, uint32_t>(value, to);
}

} // namespace numfmt
