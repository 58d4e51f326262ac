#pragma once

#include <cstddef>

namespace speakml::core::config {

inline constexpr const char kRootTagName[] = "speak";
inline constexpr std::size_t kDefaultCacheCapacity = 128;
inline constexpr const char kProgramName[] = "speakml";
inline constexpr const char kVersionString[] = "speakml 0.1.0";

} // namespace speakml::core::config
