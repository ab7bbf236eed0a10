#include "numfmt/format.hh"
#include "numfmt/zero_copy.hh"

#define BOOST_TEST_MODULE FormatTest
#include <boost/test/unit_test.hpp>

#include <limits>
#include <string>

#include <stdint.h>
#include <string.h>

namespace numfmt {
namespace {

template <class T> std::string Text(T value) {
  char buf[kIntegerBufferSize];
  Result result(Format(value, buf, sizeof(buf)));
  BOOST_REQUIRE_EQUAL(OK, result.status);
  BOOST_REQUIRE(result.length > 0 && result.length <= sizeof(buf));
  return std::string(buf, result.length);
}

template <class T> void CheckRejected(T value) {
  const std::size_t minimum = MinimumSize<T>();
  char buf[kIntegerBufferSize + 1];
  memset(buf, 'x', sizeof(buf));

  Result result(Format(value, buf, minimum - 1));
  BOOST_CHECK_EQUAL(BUFFER_TOO_SMALL, result.status);
  BOOST_CHECK_EQUAL(0U, result.length);
  result = Format(value, buf, 0);
  BOOST_CHECK_EQUAL(BUFFER_TOO_SMALL, result.status);
  for (const char *i = buf; i != buf + sizeof(buf); ++i) {
    BOOST_CHECK_EQUAL('x', *i);
  }

  result = Format(value, NULL, minimum);
  BOOST_CHECK_EQUAL(NULL_BUFFER, result.status);
  BOOST_CHECK_EQUAL(0U, result.length);
  // Null is reported even when the size is also wrong.
  result = Format(value, NULL, 0);
  BOOST_CHECK_EQUAL(NULL_BUFFER, result.status);

  result = Format(value, buf, minimum);
  BOOST_CHECK_EQUAL(OK, result.status);
}

BOOST_AUTO_TEST_CASE(Minimums) {
  BOOST_CHECK_EQUAL(24U, MinimumSize<double>());
  BOOST_CHECK_EQUAL(24U, MinimumSize<float>());
  BOOST_CHECK_EQUAL(40U, MinimumSize<int64_t>());
  BOOST_CHECK_EQUAL(40U, MinimumSize<uint64_t>());
  BOOST_CHECK_EQUAL(40U, MinimumSize<int32_t>());
  BOOST_CHECK_EQUAL(40U, MinimumSize<uint32_t>());
  // The formatters never need more than the contract asks of callers.
  BOOST_CHECK_LE(static_cast<std::size_t>(ToStringBuf<double>::kBytes), kFloatBufferSize);
  BOOST_CHECK_LE(static_cast<std::size_t>(ToStringBuf<float>::kBytes), kFloatBufferSize);
  BOOST_CHECK_LE(static_cast<std::size_t>(ToStringBuf<int64_t>::kBytes), kIntegerBufferSize);
  BOOST_CHECK_LE(static_cast<std::size_t>(ToStringBuf<uint64_t>::kBytes), kIntegerBufferSize);
}

BOOST_AUTO_TEST_CASE(Rejects) {
  CheckRejected(1.5);
  CheckRejected(1.5f);
  CheckRejected(static_cast<int64_t>(-7));
  CheckRejected(static_cast<uint64_t>(7));
  CheckRejected(static_cast<int32_t>(-7));
  CheckRejected(static_cast<uint32_t>(7));
}

BOOST_AUTO_TEST_CASE(Dispatch) {
  BOOST_CHECK_EQUAL("123456789.0", Text(123456789.0));
  BOOST_CHECK_EQUAL("0.1", Text(0.1));
  BOOST_CHECK_EQUAL("-0.0", Text(-0.0));
  BOOST_CHECK_EQUAL("NaN", Text(std::numeric_limits<double>::quiet_NaN()));
  BOOST_CHECK_EQUAL("-inf", Text(-std::numeric_limits<float>::infinity()));
  BOOST_CHECK_EQUAL("3.14", Text(3.14f));
  BOOST_CHECK_EQUAL("-9223372036854775808", Text(std::numeric_limits<int64_t>::min()));
  BOOST_CHECK_EQUAL("18446744073709551615", Text(std::numeric_limits<uint64_t>::max()));
  BOOST_CHECK_EQUAL("-2147483648", Text(std::numeric_limits<int32_t>::min()));
  BOOST_CHECK_EQUAL("4294967295", Text(std::numeric_limits<uint32_t>::max()));
  BOOST_CHECK_EQUAL("0", Text(static_cast<int32_t>(0)));
}

BOOST_AUTO_TEST_CASE(FiniteMatchesChecked) {
  const double kValues[] = {0.0, -0.0, 1.0, 0.1, -42.5, 1e20, 1e-10, 123456789.0, 3.4e38};
  for (const double *i = kValues; i != kValues + sizeof(kValues) / sizeof(double); ++i) {
    char checked[kFloatBufferSize], finite[kFloatBufferSize];
    Result a(Format(*i, checked, sizeof(checked)));
    Result b(FormatFinite(*i, finite, sizeof(finite)));
    BOOST_REQUIRE_EQUAL(OK, a.status);
    BOOST_REQUIRE_EQUAL(OK, b.status);
    BOOST_CHECK_EQUAL(std::string(checked, a.length), std::string(finite, b.length));

    float as_float = static_cast<float>(*i);
    a = Format(as_float, checked, sizeof(checked));
    b = FormatFinite(as_float, finite, sizeof(finite));
    BOOST_CHECK_EQUAL(std::string(checked, a.length), std::string(finite, b.length));
  }

  char buf[kFloatBufferSize];
  BOOST_CHECK_EQUAL(BUFFER_TOO_SMALL, FormatFinite(1.0, buf, kFloatBufferSize - 1).status);
  BOOST_CHECK_EQUAL(NULL_BUFFER, FormatFinite(1.0f, NULL, kFloatBufferSize).status);
}

BOOST_AUTO_TEST_CASE(Throws) {
  char buf[kIntegerBufferSize];
  BOOST_CHECK_EQUAL(3U, FormatOrThrow(static_cast<int32_t>(-12), buf, sizeof(buf)));
  BOOST_CHECK_EQUAL("-12", std::string(buf, 3));
  BOOST_CHECK_EQUAL(3U, FormatOrThrow(std::numeric_limits<double>::infinity(), buf, kFloatBufferSize));
  BOOST_CHECK_EQUAL("inf", std::string(buf, 3));

  BOOST_CHECK_THROW(FormatOrThrow(1.0, NULL, kFloatBufferSize), BufferException);
  BOOST_CHECK_THROW(FormatOrThrow(static_cast<uint64_t>(1), buf, kIntegerBufferSize - 1), Exception);
  try {
    FormatOrThrow(2.5f, buf, 10);
    BOOST_FAIL("Expected an exception");
  } catch (const BufferException &e) {
    BOOST_CHECK_EQUAL(10U, e.Size());
    BOOST_CHECK_EQUAL(kFloatBufferSize, e.Minimum());
    BOOST_CHECK(std::string(e.what()).find("smaller than the 24 bytes") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(AssignReplacesMessage) {
  char buf[1];
  BufferException small(buf, 1, kFloatBufferSize);
  BufferException null(NULL, kFloatBufferSize, kFloatBufferSize);
  small = null;
  BOOST_CHECK_EQUAL(std::string(null.what()), small.what());
  small << "More.";
  BOOST_CHECK_EQUAL(std::string(null.what()) + "More.", small.what());
}

// Returns text that sits inside the scratch but not at its start.
struct ShiftedText {
  static const std::size_t kMinimum = 16;

  static ByteSpan Format(int /*value*/, char *scratch) {
    memcpy(scratch + 2, "abcdefgh", 8);
    return ByteSpan(scratch + 2, 8);
  }
};

BOOST_AUTO_TEST_CASE(OverlappingCopy) {
  char buf[ShiftedText::kMinimum];
  memset(buf, 'x', sizeof(buf));
  BOOST_CHECK_EQUAL(8U, WriteInPlace<ShiftedText>(0, buf));
  BOOST_CHECK_EQUAL("abcdefgh", std::string(buf, 8));
}

BOOST_AUTO_TEST_CASE(LiteralCopied) {
  char buf[kFloatBufferSize];
  memset(buf, 'x', sizeof(buf));
  BOOST_CHECK_EQUAL(3U, WriteInPlace<CheckedFloat>(std::numeric_limits<double>::quiet_NaN(), buf));
  BOOST_CHECK_EQUAL("NaNx", std::string(buf, 4));
}

}} // namespaces
