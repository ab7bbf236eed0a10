#ifndef NUMFMT_NUMFMT_H
#define NUMFMT_NUMFMT_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Number to decimal text for foreign callers.
 *
 * Every function writes ASCII text to buf[0, n) and returns n, where
 * 0 < n <= buf_len.  It returns 0 and writes nothing if buf is null or
 * buf_len is below the buffer size for its family.  No null terminator, no
 * allocation, no state between calls.  Calls on distinct buffers may run
 * concurrently.
 */

/* Enough for any float or double. */
#define NUMFMT_FLOAT_BUFFER_SIZE 24

/* Enough for any integer up to 128 bits.  Required by all the itoa functions. */
#define NUMFMT_INTEGER_BUFFER_SIZE 40

/* Shortest text that parses back to value.  Integer valued results keep a
 * ".0" suffix.  Exponential notation below 1e-5 and from 1e16 up, as in
 * "1e-10" or "1.5e300".  NaN is "NaN", infinities are "inf" and "-inf".
 */
size_t numfmt_format_f64(double value, uint8_t *buf, size_t buf_len);
size_t numfmt_format_f32(float value, uint8_t *buf, size_t buf_len);

/* As above for values known to be finite.  NaN and infinity are not
 * spelled out: they produce "0.0".  Check with numfmt_is_finite_f64/f32.
 */
size_t numfmt_format_finite_f64(double value, uint8_t *buf, size_t buf_len);
size_t numfmt_format_finite_f32(float value, uint8_t *buf, size_t buf_len);

/* Nonzero when value is neither NaN nor infinite. */
int numfmt_is_finite_f64(double value);
int numfmt_is_finite_f32(float value);

/* Minimal digits with a leading '-' for negatives.  Zero is "0". */
size_t numfmt_itoa_i64(int64_t value, uint8_t *buf, size_t buf_len);
size_t numfmt_itoa_u64(uint64_t value, uint8_t *buf, size_t buf_len);
size_t numfmt_itoa_i32(int32_t value, uint8_t *buf, size_t buf_len);
size_t numfmt_itoa_u32(uint32_t value, uint8_t *buf, size_t buf_len);

#ifdef __cplusplus
}
#endif

#endif /* NUMFMT_NUMFMT_H */
