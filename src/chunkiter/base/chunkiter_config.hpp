/*
 * chunkiter_config.hpp
 *
 * Build toggles shared by every chunkiter header.
 */

#ifndef CHUNKITER_CONFIG_HPP_
#define CHUNKITER_CONFIG_HPP_

/*
 * chunkiter settings
 * Build toggles:
 *   - CHUNKITER_ASSERT(x) (default: empty)
 *       Contract hook. Fires on out-of-range slot access and emplace into a
 *       full staging buffer. Tests map it to std::abort() in debug builds.
 *
 *   - CHUNKITER_ON_MISUSE(msg) (default: see chunkiter_tools.hpp)
 *       Always on, in every build. Fires when a retired chunker (leftover
 *       taken, or moved from) is used again. Default: throws
 *       std::logic_error with exceptions enabled, std::abort() otherwise.
 *       Must not return.
 *
 *   - CHUNKITER_ENABLE_EXCEPTIONS (default: 0)
 *       0 -> library assumes "no exceptions" mode. Sources and T must not throw.
 *       1 -> the fill loop and the hand-out are wrapped; a throwing source
 *            marks the chunker failed and the exception is rethrown.
 */

// assert ------------------------
#ifndef CHUNKITER_ASSERT
#  define CHUNKITER_ASSERT(x)
#endif /* CHUNKITER_ASSERT */

// ============================================================================
// Exceptions configuration
// ============================================================================
//
// Single switch:
//   - CHUNKITER_ENABLE_EXCEPTIONS == 0 : library assumes "no exceptions" mode.
//   - CHUNKITER_ENABLE_EXCEPTIONS == 1 : library may use throwing paths.
//
// Default: 0 (no exceptions).
//

#ifndef CHUNKITER_ENABLE_EXCEPTIONS
#  define CHUNKITER_ENABLE_EXCEPTIONS 0
#endif /* CHUNKITER_ENABLE_EXCEPTIONS */

#endif /* CHUNKITER_CONFIG_HPP_ */
