#ifndef NUMFMT_FORMAT_H
#define NUMFMT_FORMAT_H

#include "numfmt/buffer_contract.hh"
#include "numfmt/dispatch.hh"
#include "numfmt/exception.hh"

#include <cstddef>

#include <stdint.h>

namespace numfmt {

/* On OK, length bytes of text are at the start of the destination and
 * 0 < length <= size.  Otherwise length is 0 and nothing was written.
 */
struct Result {
  Status status;
  std::size_t length;
};

/* Write the decimal text of value to to, which holds size bytes.  Floats
 * spell NaN and infinity as "NaN", "inf" and "-inf".  Requires size >=
 * MinimumSize<T>(): kFloatBufferSize for floats, kIntegerBufferSize for
 * integers.  No allocation.
 */
Result Format(double value, char *to, std::size_t size);
Result Format(float value, char *to, std::size_t size);
Result Format(int64_t value, char *to, std::size_t size);
Result Format(uint64_t value, char *to, std::size_t size);
Result Format(int32_t value, char *to, std::size_t size);
Result Format(uint32_t value, char *to, std::size_t size);

// Skips the NaN and infinity checks.  value must be finite.
Result FormatFinite(double value, char *to, std::size_t size);
Result FormatFinite(float value, char *to, std::size_t size);

// Like Format but throws BufferException instead of returning a status.
std::size_t FormatOrThrow(double value, char *to, std::size_t size);
std::size_t FormatOrThrow(float value, char *to, std::size_t size);
std::size_t FormatOrThrow(int64_t value, char *to, std::size_t size);
std::size_t FormatOrThrow(uint64_t value, char *to, std::size_t size);
std::size_t FormatOrThrow(int32_t value, char *to, std::size_t size);
std::size_t FormatOrThrow(uint32_t value, char *to, std::size_t size);

} // namespace numfmt

#endif // NUMFMT_FORMAT_H
