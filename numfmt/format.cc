#include "numfmt/format.hh"

#include "numfmt/zero_copy.hh"

namespace numfmt {
namespace {

template <class Algorithm, class T> Result FormatWith(T value, char *to, std::size_t size) {
  Result ret;
  ret.status = CheckBuffer(to, size, Algorithm::kMinimum);
  ret.length = (ret.status == OK) ? WriteInPlace<Algorithm>(value, to) : 0;
  return ret;
}

template <class T> Result FormatDefault(T value, char *to, std::size_t size) {
  return FormatWith<typename DefaultAlgorithm<T>::Type>(value, to, size);
}

template <class T> std::size_t FormatDefaultOrThrow(T value, char *to, std::size_t size) {
  const std::size_t minimum = MinimumSize<T>();
  NUMFMT_THROW_IF_ARG(CheckBuffer(to, size, minimum) != OK, BufferException, (to, size, minimum), "Formatting " << value << '.');
  return WriteInPlace<typename DefaultAlgorithm<T>::Type>(value, to);
}

} // namespace

Result Format(double value, char *to, std::size_t size) {
  return FormatDefault(value, to, size);
}

Result Format(float value, char *to, std::size_t size) {
  return FormatDefault(value, to, size);
}

Result Format(int64_t value, char *to, std::size_t size) {
  return FormatDefault(value, to, size);
}

Result Format(uint64_t value, char *to, std::size_t size) {
  return FormatDefault(value, to, size);
}

Result Format(int32_t value, char *to, std::size_t size) {
  return FormatDefault(value, to, size);
}

Result Format(uint32_t value, char *to, std::size_t size) {
  return FormatDefault(value, to, size);
}

Result FormatFinite(double value, char *to, std::size_t size) {
  return FormatWith<FiniteFloat>(value, to, size);
}

Result FormatFinite(float value, char *to, std::size_t size) {
  return FormatWith<FiniteFloat>(value, to, size);
}

std::size_t FormatOrThrow(double value, char *to, std::size_t size) {
  return FormatDefaultOrThrow(value, to, size);
}

std::size_t FormatOrThrow(float value, char *to, std::size_t size) {
  return FormatDefaultOrThrow(value, to, size);
}

std::size_t FormatOrThrow(int64_t value, char *to, std::size_t size) {
  return FormatDefaultOrThrow(value, to, size);
}

std::size_t FormatOrThrow(uint64_t value, char *to, std::size_t size) {
  return FormatDefaultOrThrow(value, to, size);
}

std::size_t FormatOrThrow(int32_t value, char *to, std::size_t size) {
  return FormatDefaultOrThrow(value, to, size);
}

std::size_t FormatOrThrow(uint32_t value, char *to, std::size_t size) {
  return FormatDefaultOrThrow(value, to, size);
}

} // namespace numfmt
