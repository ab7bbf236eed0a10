#include "numfmt/exception.hh"

#ifdef __GXX_RTTI
#include <typeinfo>
#endif

namespace numfmt {

Exception::Exception() throw() {}
Exception::~Exception() throw() {}

Exception::Exception(const Exception &from) : std::exception() {
  stream_ << from.stream_.str();
}

Exception &Exception::operator=(const Exception &from) {
  stream_.str(from.stream_.str());
  stream_.seekp(0, std::ios_base::end);
  return *this;
}

const char *Exception::what() const throw() {
  text_ = stream_.str();
  return text_.c_str();
}

void Exception::SetLocation(const char *file, unsigned int line, const char *func, const char *child_name, const char *condition) {
  /* The child class might have set some text in its constructor, but the
   * location comes first.
   */
  text_ = stream_.str();
  stream_.str("");
  stream_ << file << ':' << line;
  if (func) stream_ << " in " << func << " threw ";
  if (child_name) {
    stream_ << child_name;
  } else {
#ifdef __GXX_RTTI
    stream_ << typeid(this).name();
#else
    stream_ << "an exception";
#endif
  }
  if (condition) stream_ << " because `" << condition;
  stream_ << "'.\n";
  stream_ << text_;
}

BufferException::BufferException(const void *buffer, size_t size, size_t minimum) throw()
  : size_(size), minimum_(minimum) {
  if (!buffer) {
    *this << "Null destination buffer. ";
  } else {
    *this << "Destination buffer of " << size << " bytes is smaller than the " << minimum << " bytes required. ";
  }
}

BufferException::~BufferException() throw() {}

} // namespace numfmt
