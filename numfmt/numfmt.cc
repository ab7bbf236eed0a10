#include "numfmt/numfmt.h"

#include "numfmt/format.hh"
#include "numfmt/zero_copy.hh"

#include <cmath>

namespace {

// Collapse the status: foreign callers only learn success or failure.
inline size_t Length(const numfmt::Result &result) {
  return result.status == numfmt::OK ? result.length : 0;
}

} // namespace

extern "C" {

size_t numfmt_format_f64(double value, uint8_t *buf, size_t buf_len) {
  return Length(numfmt::Format(value, numfmt::AsScratch(buf), buf_len));
}

size_t numfmt_format_f32(float value, uint8_t *buf, size_t buf_len) {
  return Length(numfmt::Format(value, numfmt::AsScratch(buf), buf_len));
}

size_t numfmt_format_finite_f64(double value, uint8_t *buf, size_t buf_len) {
  return Length(numfmt::FormatFinite(value, numfmt::AsScratch(buf), buf_len));
}

size_t numfmt_format_finite_f32(float value, uint8_t *buf, size_t buf_len) {
  return Length(numfmt::FormatFinite(value, numfmt::AsScratch(buf), buf_len));
}

int numfmt_is_finite_f64(double value) {
  return std::isfinite(value) ? 1 : 0;
}

int numfmt_is_finite_f32(float value) {
  return std::isfinite(value) ? 1 : 0;
}

size_t numfmt_itoa_i64(int64_t value, uint8_t *buf, size_t buf_len) {
  return Length(numfmt::Format(value, numfmt::AsScratch(buf), buf_len));
}

size_t numfmt_itoa_u64(uint64_t value, uint8_t *buf, size_t buf_len) {
  return Length(numfmt::Format(value, numfmt::AsScratch(buf), buf_len));
}

size_t numfmt_itoa_i32(int32_t value, uint8_t *buf, size_t buf_len) {
  return Length(numfmt::Format(value, numfmt::AsScratch(buf), buf_len));
}

size_t numfmt_itoa_u32(uint32_t value, uint8_t *buf, size_t buf_len) {
  return Length(numfmt::Format(value, numfmt::AsScratch(buf), buf_len));
}

} // extern "C"
