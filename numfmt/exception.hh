#ifndef NUMFMT_EXCEPTION_H
#define NUMFMT_EXCEPTION_H

#include <exception>
#include <sstream>
#include <string>

#include <stddef.h>

namespace numfmt {

template <class Except, class Data> typename Except::template ExceptionTag<Except&>::Identity operator<<(Except &e, const Data &data);

class Exception : public std::exception {
  public:
    Exception() throw();
    virtual ~Exception() throw();

    Exception(const Exception &from);
    Exception &operator=(const Exception &from);

    // Not threadsafe.  Each thread should catch its own copy.
    const char *what() const throw();

    // For use by the NUMFMT_THROW macros.
    void SetLocation(
        const char *file,
        unsigned int line,
        const char *func,
        const char *child_name,
        const char *condition);

  private:
    template <class Except, class Data> friend typename Except::template ExceptionTag<Except&>::Identity operator<<(Except &e, const Data &data);

    // This helps restrict operator<< defined below.
    template <class T> struct ExceptionTag {
      typedef T Identity;
    };

    std::stringstream stream_;
    mutable std::string text_;
};

/* Appends to the what() message of Exception and its children.  SFINAE on
 * ExceptionTag keeps this from matching anything else.
 */
template <class Except, class Data> typename Except::template ExceptionTag<Except&>::Identity operator<<(Except &e, const Data &data) {
  e.stream_ << data;
  return e;
}

#ifdef __GNUC__
#define NUMFMT_FUNC_NAME __PRETTY_FUNCTION__
#else
#ifdef _WIN32
#define NUMFMT_FUNC_NAME __FUNCTION__
#else
#define NUMFMT_FUNC_NAME NULL
#endif
#endif

/* Create an instance of Exception, add the message Modify, and throw it.
 * Modify can contain << for ostream operations.  Arg is passed to the
 * exception's constructor.
 */
#define NUMFMT_THROW_BACKEND(Condition, Exception, Arg, Modify) do { \
  Exception NUMFMT_e Arg; \
  NUMFMT_e.SetLocation(__FILE__, __LINE__, NUMFMT_FUNC_NAME, #Exception, Condition); \
  NUMFMT_e << Modify; \
  throw NUMFMT_e; \
} while (0)

#if __GNUC__ >= 3
#define NUMFMT_UNLIKELY(x) __builtin_expect (!!(x), 0)
#else
#define NUMFMT_UNLIKELY(x) (x)
#endif

#define NUMFMT_THROW_IF_ARG(Condition, Exception, Arg, Modify) do { \
  if (NUMFMT_UNLIKELY(Condition)) { \
    NUMFMT_THROW_BACKEND(#Condition, Exception, Arg, Modify); \
  } \
} while (0)

#define NUMFMT_THROW_IF2(Condition, Modify) \
  NUMFMT_THROW_IF_ARG(Condition, numfmt::Exception, , Modify)

// The destination handed to FormatOrThrow was null or below the minimum size.
class BufferException : public Exception {
  public:
    BufferException(const void *buffer, size_t size, size_t minimum) throw();
    ~BufferException() throw();

    size_t Size() const throw() { return size_; }
    size_t Minimum() const throw() { return minimum_; }

  private:
    size_t size_, minimum_;
};

} // namespace numfmt

#endif // NUMFMT_EXCEPTION_H
