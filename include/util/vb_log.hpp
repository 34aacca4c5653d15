#pragma once
#include <iostream>
#include <sstream>
#include <string>

#define VB_C_RED "\033[91m"
#define VB_C_GREEN "\033[92m"
#define VB_C_YELLOW "\033[93m"
#define VB_C_BLUE "\033[94m"
#define VB_C_PINK "\033[95m"
#define VB_C_LBLUE "\033[96m"
#define VB_C_WHITE "\033[0m"

// logs the streamed message and throws E with the message and its origin
#define VB_THROW(E, ...)                                   \
{                                                          \
  std::ostringstream vb_msg_;                              \
  vb_msg_ << __VA_ARGS__;                                  \
  std::cerr << VB_C_RED << vb_msg_.str() << VB_C_WHITE << std::endl; \
  vb_msg_ << " (" << __FILE__ << ": " << __LINE__ << ")";  \
  throw E(vb_msg_.str());                                  \
}

#define VB_ASSERT(X, E, ...) if (!(X)) VB_THROW(E, __VA_ARGS__);

#define VB_WARN(...) std::cerr << VB_C_YELLOW << __VA_ARGS__ << VB_C_WHITE << std::endl

#if defined(VB_VERBOSE)
#define VB_DEBUG(...) std::cout << VB_C_LBLUE << __VA_ARGS__ << VB_C_WHITE << std::endl
#else
#define VB_DEBUG(...) void(0)
#endif
