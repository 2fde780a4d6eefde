#pragma once

#include <cstddef>
#include <string>

namespace mld::config {

// Base64 text of "gid://hs3/Category/", the global id prefix of every category.
inline constexpr const char* kDefaultTokenPrefix = "Z2lkOi8vaHMzL0NhdGVnb3J5Lz";
inline constexpr const char* kDefaultIdMarker = "/Category/";

inline constexpr int kDefaultByteStride = 4;
inline constexpr double kDefaultPlausibleMin = 0.3;
inline constexpr double kDefaultPlausibleMax = 400.0;
inline constexpr int kDefaultLookaheadWindow = 1024;
inline constexpr double kDefaultPriceScale = 1.0;
inline constexpr std::size_t kDefaultMaxInflatedBytes = 16 * 1024 * 1024;

struct IdentifierPattern {
    std::string prefix = kDefaultTokenPrefix;
    std::string id_marker = kDefaultIdMarker;
    std::string encoding = "base64";      // "base64" or "plain"
    int max_token_length = 128;
};

struct DecoderSettings {
    int byte_stride = kDefaultByteStride;
    double plausible_min = kDefaultPlausibleMin;
    double plausible_max = kDefaultPlausibleMax;
    int lookahead_window = kDefaultLookaheadWindow;
    bool keep_empty_records = true;
    double price_scale_constant = kDefaultPriceScale;
    std::string role_strategy = "positional";   // "positional" or "ranked_average"
    std::string field_anchor = "token";         // "token" or "buffer": where the stride grid starts
    IdentifierPattern identifier;
    std::size_t max_inflated_bytes = kDefaultMaxInflatedBytes;
    bool inflate_fallback_to_raw = false;
};

struct ApiSettings {
    std::string graphql_url = "https://api3.hotstreak.gg/graphql";
    std::string id_token;
    std::string sport_id = "Z2lkOi8vaHMzL1Nwb3J0LzI";  // football
    int connect_timeout_seconds = 10;
    int transfer_timeout_seconds = 20;
};

struct ServiceSettings {
    int worker_threads = 1;
};

struct OutputSettings {
    std::string format = "json";          // "json", "csv", or "parquet"
    std::string directory = "data";
};

struct Settings {
    DecoderSettings decoder;
    ApiSettings api;
    ServiceSettings service;
    OutputSettings output;

    // Throws std::invalid_argument on the first invalid field.
    void validate() const;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace mld::config
