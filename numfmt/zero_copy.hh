#ifndef NUMFMT_ZERO_COPY_H
#define NUMFMT_ZERO_COPY_H

#include "numfmt/byte_span.hh"

#include <cstddef>
#include <cstring>

#include <stdint.h>

namespace numfmt {

/* The one place foreign bytes become formatter scratch.  No initialization:
 * formatters only write to scratch before reading it back.
 */
inline char *AsScratch(uint8_t *buffer) {
  return reinterpret_cast<char*>(buffer);
}

// memmove because nothing stops a literal from living inside caller memory.
inline void CopyLiteral(const ByteSpan &text, char *to) {
  std::memmove(to, text.data(), text.size());
}

/* Format value with Algorithm directly in to and return the length of the
 * text now at to.  Precondition: to has Algorithm::kMinimum writable bytes.
 */
template <class Algorithm, class T> std::size_t WriteInPlace(T value, char *to) {
  const ByteSpan text(Algorithm::Format(value, to));
  if (text.data() != to) CopyLiteral(text, to);
  return text.size();
}

} // namespace numfmt

#endif // NUMFMT_ZERO_COPY_H
