#ifndef DOCPRESS_COMMON_CONFIG_HPP
#define DOCPRESS_COMMON_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <type_traits>

#ifndef NDEBUG // debug builds
#define DOCPRESS_IF_DEBUG(...) __VA_ARGS__
#define DOCPRESS_IF_NOT_DEBUG(...)
#else // release builds
#define DOCPRESS_IF_DEBUG(...)
#define DOCPRESS_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#define DOCPRESS_UNREACHABLE() __builtin_unreachable()

namespace docpress {

/// @brief 64-bit unsigned integer.
using Uint64 = std::uint64_t;
/// @brief 64-bit signed integer.
using Int64 = std::int64_t;
/// @brief 32-bit unsigned integer.
using Uint32 = std::uint32_t;
/// @brief 32-bit signed integer.
using Int32 = std::int32_t;

/// @brief Convenience alias for std::size_t.
using Size = std::size_t;
/// @brief Convenience alias for `std::ptrdiff_t`.
using Difference = std::ptrdiff_t;

/// @brief The integer type used for integer-valued settings.
using Int = Int64;

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define DOCPRESS_ENUM_STRING_CASE(...)                                                             \
    case __VA_ARGS__: return #__VA_ARGS__

template <typename>
inline constexpr bool dependent_false = false;

} // namespace docpress

#endif
