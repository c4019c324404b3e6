#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace dumptruck {

namespace defaults {
inline constexpr std::string_view kTool = "aws";
inline constexpr std::string_view kOutputDir = "./dumptruck";
inline constexpr auto kTimeout = std::chrono::seconds(300);
// Keeps the seconds -> milliseconds conversion of a timeout in range.
inline constexpr auto kMaxTimeout = std::chrono::hours(24 * 365);
inline constexpr std::size_t kCacheCapacity = 4096;
}

namespace help {
// Man-page section headings are rendered bold by overstriking each character
// ("S\bSE\bE..."). Once the backspaces are stripped every letter is doubled.
inline constexpr std::string_view kServicesMarker = "SSEERRVVIICCEESS";
inline constexpr std::string_view kCommandsMarker = "CCOOMMMMAANNDDSS";
inline constexpr std::string_view kBulletPrefix = "+o ";
inline constexpr std::size_t kMinItemLineLength = 5;
inline constexpr std::string_view kHelpArg = "help";
}

namespace io {
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
inline constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
}

}  // namespace dumptruck
