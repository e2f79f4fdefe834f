#pragma once

#include <cstdint>
#include <limits>

/// Tool name, used as the job name prefix
constexpr char VERIFYREP_NAME[] = "verifyrep";

/// Time range defaults. The end bound is exclusive; INT64_MAX stands for "forever".
constexpr int64_t DEFAULT_START_TIME_MS = 0;
constexpr int64_t DEFAULT_END_TIME_MS = std::numeric_limits<int64_t>::max();

/// Rows fetched per scanner round trip when nothing is configured
constexpr int DEFAULT_SCAN_CACHING = 1;

/// Scanner lease the client asks for. The server may grant less.
constexpr int64_t DEFAULT_SCANNER_LEASE_MS = 60000;

/// Metadata key carrying the peer's security context on remote scan calls
constexpr char SECURITY_CONTEXT_METADATA_KEY[] = "x-verifyrep-security-context";
