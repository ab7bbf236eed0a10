#ifndef NUMFMT_INTEGER_TO_STRING_H
#define NUMFMT_INTEGER_TO_STRING_H
#include <cstddef>
#include <stdint.h>

namespace numfmt {

/* These functions write the decimal text of value starting at to and return
 * the end of what they wrote.  No null terminator.  The caller must provide
 * ToStringBuf<T>::kBytes bytes at to.
 */
char *ToString(uint64_t value, char *to);
char *ToString(int64_t value, char *to);
char *ToString(uint32_t value, char *to);
char *ToString(int32_t value, char *to);

// Buffer size needed by ToString(T, char*).
template <class T> struct ToStringBuf;
template <> struct ToStringBuf<uint32_t> {
  static const unsigned kBytes = 10;
};
template <> struct ToStringBuf<int32_t> {
  static const unsigned kBytes = 11;
};
template <> struct ToStringBuf<uint64_t> {
  static const unsigned kBytes = 20;
};
template <> struct ToStringBuf<int64_t> {
  // Not a typo.  2^63 has 19 digits.
  static const unsigned kBytes = 20;
};

} // namespace numfmt

#endif // NUMFMT_INTEGER_TO_STRING_H
