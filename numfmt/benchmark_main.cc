#include "numfmt/numfmt.h"
#include "numfmt/exception.hh"
#include "numfmt/usage.hh"

#include <boost/program_options.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int.hpp>
#include <boost/random/variate_generator.hpp>

#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <stdint.h>
#include <string.h>

namespace numfmt {
namespace {

template <class T> struct EntryPoint {
  typedef size_t (*Function)(T value, uint8_t *buf, size_t buf_len);
};

// Random bit patterns reinterpreted as the type under test.
template <class T> T FromBits(uint64_t bits) {
  T ret;
  memcpy(&ret, &bits, sizeof(T));
  return ret;
}

// The finite entry points must not see NaN or infinity.
template <class T> bool Usable(T /*value*/, bool /*finite_only*/) { return true; }
template <> bool Usable<double>(double value, bool finite_only) { return !finite_only || numfmt_is_finite_f64(value); }
template <> bool Usable<float>(float value, bool finite_only) { return !finite_only || numfmt_is_finite_f32(value); }

template <class T> void Time(const char *name, typename EntryPoint<T>::Function function, size_t buf_len, bool finite_only, const std::vector<uint64_t> &bits) {
  std::vector<T> values;
  values.reserve(bits.size());
  for (std::vector<uint64_t>::const_iterator i = bits.begin(); i != bits.end(); ++i) {
    T value = FromBits<T>(*i);
    if (Usable(value, finite_only)) values.push_back(value);
  }
  NUMFMT_THROW_IF2(values.empty(), "No usable values for " << name << ".");

  uint8_t buf[NUMFMT_INTEGER_BUFFER_SIZE];
  uint64_t bytes = 0;
  double start = CPUTime();
  for (typename std::vector<T>::const_iterator i = values.begin(); i != values.end(); ++i) {
    size_t length = function(*i, buf, buf_len);
    NUMFMT_THROW_IF2(!length, name << " failed on value " << *i << " with a buffer of " << buf_len << " bytes.");
    bytes += length;
  }
  double elapsed = CPUTime() - start;
  std::cout << name << '\t' << values.size() << " calls\t"
    << (elapsed * 1000000000.0 / static_cast<double>(values.size())) << " ns/call\t"
    << bytes << " bytes" << std::endl;
}

bool Wants(const std::string &type, const char *name) {
  return type == "all" || type == name;
}

} // namespace
} // namespace numfmt

int main(int argc, char *argv[]) {
  try {
    namespace po = boost::program_options;
    uint64_t iterations;
    uint32_t seed;
    std::string type;
    po::options_description options("Number formatting benchmark");
    options.add_options()
      ("help,h", po::bool_switch(), "Show this help message")
      ("iterations,n", po::value<uint64_t>(&iterations)->default_value(10000000), "Values to format per entry point")
      ("type,t", po::value<std::string>(&type)->default_value("all"), "Entry point: f64, f32, finite_f64, finite_f32, i64, u64, i32, u32, or all")
      ("seed,s", po::value<uint32_t>(&seed)->default_value(42), "Random seed for the values");
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, options), vm);
    if (vm["help"].as<bool>()) {
      std::cerr << "Times each formatting entry point on random bit patterns.\n\n" << options << std::endl;
      return 1;
    }
    po::notify(vm);

    const char *kTypes[] = {"all", "f64", "f32", "finite_f64", "finite_f32", "i64", "u64", "i32", "u32"};
    bool known = false;
    for (const char **i = kTypes; i != kTypes + sizeof(kTypes) / sizeof(const char*); ++i) {
      known |= (type == *i);
    }
    if (!known) {
      std::cerr << "Unknown type " << type << ".\n" << options << std::endl;
      return 1;
    }

    boost::mt19937 rng(seed);
    boost::uniform_int<uint32_t> range(0, std::numeric_limits<uint32_t>::max());
    boost::variate_generator<boost::mt19937&, boost::uniform_int<uint32_t> > gen(rng, range);
    std::vector<uint64_t> bits;
    bits.reserve(iterations);
    for (uint64_t i = 0; i < iterations; ++i) {
      uint64_t high = gen();
      bits.push_back((high << 32) | gen());
    }

    using namespace numfmt;
    if (Wants(type, "f64")) Time<double>("f64", &numfmt_format_f64, NUMFMT_FLOAT_BUFFER_SIZE, false, bits);
    if (Wants(type, "f32")) Time<float>("f32", &numfmt_format_f32, NUMFMT_FLOAT_BUFFER_SIZE, false, bits);
    if (Wants(type, "finite_f64")) Time<double>("finite_f64", &numfmt_format_finite_f64, NUMFMT_FLOAT_BUFFER_SIZE, true, bits);
    if (Wants(type, "finite_f32")) Time<float>("finite_f32", &numfmt_format_finite_f32, NUMFMT_FLOAT_BUFFER_SIZE, true, bits);
    if (Wants(type, "i64")) Time<int64_t>("i64", &numfmt_itoa_i64, NUMFMT_INTEGER_BUFFER_SIZE, false, bits);
    if (Wants(type, "u64")) Time<uint64_t>("u64", &numfmt_itoa_u64, NUMFMT_INTEGER_BUFFER_SIZE, false, bits);
    if (Wants(type, "i32")) Time<int32_t>("i32", &numfmt_itoa_i32, NUMFMT_INTEGER_BUFFER_SIZE, false, bits);
    if (Wants(type, "u32")) Time<uint32_t>("u32", &numfmt_itoa_u32, NUMFMT_INTEGER_BUFFER_SIZE, false, bits);

    numfmt::PrintUsage(std::cerr);
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return 0;
}
