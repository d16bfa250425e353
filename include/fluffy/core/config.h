#ifndef FLUFFY_CORE_CONFIG_H
#define FLUFFY_CORE_CONFIG_H

#include <cstddef>

namespace fluffy::core::config {

// Untagged content is delivered once the buffer grows past this many chars.
inline constexpr std::size_t kDefaultAutoProcessThreshold = 20;

// Longest content excerpt carried by an error before it is cut with "...".
inline constexpr std::size_t kContentPreviewLimit = 100;

inline constexpr std::size_t kDiagnosticHistoryLimit = 256;

inline constexpr const char kVersionString[] = "fluffy 1.0.0";

}  // namespace fluffy::core::config

#endif  // FLUFFY_CORE_CONFIG_H
