#ifndef NUMFMT_BUFFER_CONTRACT_H
#define NUMFMT_BUFFER_CONTRACT_H

#include <cstddef>

namespace numfmt {

typedef enum {OK=0, NULL_BUFFER=1, BUFFER_TOO_SMALL=2} Status;

// Every float entry point, checked or not, needs this much.
const std::size_t kFloatBufferSize = 24;

/* Every integer entry point needs this much regardless of width: the longest
 * signed 128-bit decimal.  Wider than necessary for 64 bits so that callers
 * can size one buffer for any integer.
 */
const std::size_t kIntegerBufferSize = 40;

// Decides before anything is written.  A null pointer wins over the size.
inline Status CheckBuffer(const void *to, std::size_t size, std::size_t minimum) {
  if (!to) return NULL_BUFFER;
  if (size < minimum) return BUFFER_TOO_SMALL;
  return OK;
}

} // namespace numfmt

#endif // NUMFMT_BUFFER_CONTRACT_H
