/**
 * @file platform.hpp
 * @brief POSIX detection and the RECON_ASSERT macro.
 *
 * RECON_ASSERT guards programming errors only. Runtime failures (control
 * plane, transport, bad input) travel as recon::expected values.
 */

#ifndef RECON_PLATFORM_HPP_
#define RECON_PLATFORM_HPP_

#include <cstdio>
#include <cstdlib>

#if defined(__unix__) || defined(__APPLE__)
#define RECON_PLATFORM_POSIX 1
#endif

namespace recon {
namespace detail {

inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "RECON_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail
}  // namespace recon

#ifdef NDEBUG
#define RECON_ASSERT(cond) ((void)0)
#else
#define RECON_ASSERT(cond)                                                  \
  ((cond) ? ((void)0)                                                       \
          : ::recon::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // RECON_PLATFORM_HPP_
