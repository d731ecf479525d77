/*
 * util.hpp
 */

#ifndef UTIL_HPP_
#define UTIL_HPP_

#include <string>
#include <vector>

/*
 * Split a string delimited by sep.
 *
 * See https://stackoverflow.com/a/7408245/149138
 */
static inline std::vector<std::string> split(const std::string &text, const std::string &sep) {
  std::vector<std::string> tokens;
  std::size_t start = 0, end = 0;
  while ((end = text.find(sep, start)) != std::string::npos) {
    tokens.push_back(text.substr(start, end - start));
    start = end + sep.length();
  }
  tokens.push_back(text.substr(start));
  return tokens;
}

/**
 * Make the compiler believe value is used, so the computation producing it can't
 * be optimized away from inside a timed region.
 */
template <typename T>
static inline void do_not_optimize(const T& value) {
    asm volatile("" : : "r,m"(value) : "memory");
}

#endif /* UTIL_HPP_ */
