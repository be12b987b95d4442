#pragma once

// parcelink version information.

namespace parcelink {

constexpr int kVersionMajor = 1;
constexpr int kVersionMinor = 0;
constexpr int kVersionPatch = 0;

constexpr const char* kVersionString = "1.0.0";

constexpr const char* kFullVersionString = "parcelink 1.0.0";

#ifndef PARCELINK_BUILD_TYPE
#define PARCELINK_BUILD_TYPE "Release"
#endif

constexpr const char* kBuildType = PARCELINK_BUILD_TYPE;

}  // namespace parcelink
