#pragma once

namespace catalyst::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.3.0";

// kToolName identifies this tool in history records and audit payloads.
constexpr const char* kToolName = "project-catalyst";

}  // namespace catalyst::core
