#ifndef NUMFMT_BYTE_SPAN_H
#define NUMFMT_BYTE_SPAN_H

#include <cstddef>

namespace numfmt {

/* Text produced by a formatter: either the start of the scratch memory it
 * was given, or a static literal.  Never owns anything.
 */
class ByteSpan {
  public:
    ByteSpan() : data_(NULL), size_(0) {}

    ByteSpan(const char *data, std::size_t size) : data_(data), size_(size) {}

    ByteSpan(const char *begin, const char *end) : data_(begin), size_(end - begin) {}

    const char *data() const { return data_; }
    std::size_t size() const { return size_; }
    const char *begin() const { return data_; }
    const char *end() const { return data_ + size_; }

  private:
    const char *data_;
    std::size_t size_;
};

} // namespace numfmt

#endif // NUMFMT_BYTE_SPAN_H
