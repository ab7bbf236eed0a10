#ifndef NUMFMT_USAGE_H
#define NUMFMT_USAGE_H
#include <iosfwd>

namespace numfmt {
// Time in seconds since process started.  Zero on unsupported platforms.
double WallTime();

// User plus system CPU seconds used by this process.
double CPUTime();

void PrintUsage(std::ostream &to);
} // namespace numfmt
#endif // NUMFMT_USAGE_H
