#include "numfmt/usage.hh"

#include <ostream>

#include <stdio.h>
#if !defined(_WIN32) && !defined(_WIN64)
#include <sys/resource.h>
#include <sys/time.h>
#include <time.h>
#endif

namespace numfmt {

#if !defined(_WIN32) && !defined(_WIN64)
namespace {

double DoubleSec(const struct timeval &tv) {
  return static_cast<double>(tv.tv_sec) + (static_cast<double>(tv.tv_usec) / 1000000.0);
}
double DoubleSec(const struct timespec &tv) {
  return static_cast<double>(tv.tv_sec) + (static_cast<double>(tv.tv_nsec) / 1000000000.0);
}

class RecordStart {
  public:
    RecordStart() {
      clock_gettime(CLOCK_MONOTONIC, &started_);
    }

    const struct timespec &Started() const {
      return started_;
    }

  private:
    struct timespec started_;
};

const RecordStart kRecordStart;
} // namespace
#endif

double WallTime() {
#if defined(_WIN32) || defined(_WIN64)
  return 0.0;
#else
  struct timespec current;
  clock_gettime(CLOCK_MONOTONIC, &current);
  return DoubleSec(current) - DoubleSec(kRecordStart.Started());
#endif
}

double CPUTime() {
#if defined(_WIN32) || defined(_WIN64)
  return 0.0;
#else
  struct rusage usage;
  if (getrusage(RUSAGE_SELF, &usage))
    return 0.0;
  return DoubleSec(usage.ru_utime) + DoubleSec(usage.ru_stime);
#endif
}

void PrintUsage(std::ostream &out) {
#if !defined(_WIN32) && !defined(_WIN64)
  struct rusage usage;
  if (getrusage(RUSAGE_SELF, &usage)) {
    perror("getrusage");
    return;
  }
  out << "RSSMax:" << usage.ru_maxrss << " kB" << '\t';
  out << "user:" << DoubleSec(usage.ru_utime) << "\tsys:" << DoubleSec(usage.ru_stime) << '\t';
  out << "CPU:" << (DoubleSec(usage.ru_utime) + DoubleSec(usage.ru_stime));
  out << "\treal:" << WallTime() << '\n';
#endif
}

} // namespace numfmt
