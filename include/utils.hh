#pragma once

#include <cstdio>

/* Name of the standard the binary was compiled against */
inline const char* cpp_standard() {
  if (__cplusplus >= 202002L) return "C++20";
  if (__cplusplus >= 201703L) return "C++17";
  if (__cplusplus >= 201402L) return "C++14";
  if (__cplusplus >= 201103L) return "C++11";
  return "pre-standard C++";
}

inline void print_cpp_version() {
  printf("productionplan compiled using %s\n", cpp_standard());
}
