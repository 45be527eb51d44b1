#pragma once

// Build-time defaults. Run-time settings live in Options (pipeline.hpp).

inline constexpr char kVersion[] = "1.0.0";

inline constexpr char kUserAgent[] = "Mozilla/5.0 (X11; Linux x86_64; rv:10.0) Gecko/20100101 Firefox/10.0";

inline constexpr int kPageTimeoutMs = 30000;
inline constexpr int kResourceTimeoutMs = 120000;

inline constexpr char kDefaultPlaylistFormat[] = "pls";
inline constexpr char kManifestFileName[] = "manifest.json";
inline constexpr unsigned kDefaultJobs = 1;
inline constexpr unsigned kMaxJobs = 16;
