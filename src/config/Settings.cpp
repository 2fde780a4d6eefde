#include "config/Settings.hpp"

#include "domain/value_objects/PlausibleRange.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace mld::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (...) {
        return fallback;
    }
}

double env_double_or(const char* name, double fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stod(val);
    } catch (...) {
        return fallback;
    }
}

std::size_t env_size_or(const char* name, std::size_t fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    // stoull accepts "-1" and wraps it to SIZE_MAX
    std::string s(val);
    auto first = s.find_first_not_of(" \t\n\v\f\r");
    if (first == std::string::npos || s[first] == '-') return fallback;
    try {
        return static_cast<std::size_t>(std::stoull(val));
    } catch (...) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
    return fallback;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

} // namespace

void Settings::validate() const {
    require(decoder.byte_stride > 0,
            "byte_stride must be positive, got: " + std::to_string(decoder.byte_stride));
    require(decoder.lookahead_window > 0,
            "lookahead_window must be positive, got: " + std::to_string(decoder.lookahead_window));
    require(std::isfinite(decoder.price_scale_constant) && decoder.price_scale_constant > 0.0,
            "price_scale_constant must be finite and positive");
    require(decoder.role_strategy == "positional" || decoder.role_strategy == "ranked_average",
            "Unknown role_strategy: " + decoder.role_strategy);
    require(decoder.field_anchor == "token" || decoder.field_anchor == "buffer",
            "Unknown field_anchor: " + decoder.field_anchor);
    require(decoder.max_inflated_bytes > 0, "max_inflated_bytes must be positive");

    // Throws on its own for inverted or non-finite bounds
    (void)domain::PlausibleRange(decoder.plausible_min, decoder.plausible_max);

    const auto& id = decoder.identifier;
    require(!id.prefix.empty(), "identifier prefix must not be empty");
    require(id.encoding == "base64" || id.encoding == "plain",
            "Unknown identifier encoding: " + id.encoding);
    require(id.encoding != "base64" || !id.id_marker.empty(),
            "identifier id_marker must not be empty for base64 tokens");
    require(id.max_token_length > static_cast<int>(id.prefix.size()),
            "max_token_length must exceed the prefix length");

    require(service.worker_threads >= 1,
            "worker_threads must be at least 1, got: " + std::to_string(service.worker_threads));
    require(output.format == "json" || output.format == "csv" || output.format == "parquet",
            "Unknown output format: " + output.format);
}

Settings Settings::from_environment() {
    std::string env = env_or("MLD_ENV", "development");
    Settings s = (env == "production") ? production() : development();

    auto& d = s.decoder;
    d.byte_stride = env_int_or("MLD_BYTE_STRIDE", d.byte_stride);
    d.plausible_min = env_double_or("MLD_PLAUSIBLE_MIN", d.plausible_min);
    d.plausible_max = env_double_or("MLD_PLAUSIBLE_MAX", d.plausible_max);
    d.lookahead_window = env_int_or("MLD_LOOKAHEAD_WINDOW", d.lookahead_window);
    d.keep_empty_records = env_bool_or("MLD_KEEP_EMPTY_RECORDS", d.keep_empty_records);
    d.price_scale_constant = env_double_or("MLD_PRICE_SCALE", d.price_scale_constant);
    d.role_strategy = env_or("MLD_ROLE_STRATEGY", d.role_strategy);
    d.field_anchor = env_or("MLD_FIELD_ANCHOR", d.field_anchor);
    d.identifier.prefix = env_or("MLD_TOKEN_PREFIX", d.identifier.prefix);
    d.identifier.id_marker = env_or("MLD_ID_MARKER", d.identifier.id_marker);
    d.identifier.encoding = env_or("MLD_TOKEN_ENCODING", d.identifier.encoding);
    d.identifier.max_token_length = env_int_or("MLD_MAX_TOKEN_LENGTH", d.identifier.max_token_length);
    d.max_inflated_bytes = env_size_or("MLD_MAX_INFLATED_BYTES", d.max_inflated_bytes);
    d.inflate_fallback_to_raw = env_bool_or("MLD_INFLATE_FALLBACK", d.inflate_fallback_to_raw);

    s.api.graphql_url = env_or("MLD_GRAPHQL_URL", s.api.graphql_url);
    s.api.id_token = env_or("MLD_ID_TOKEN", s.api.id_token);
    s.api.sport_id = env_or("MLD_SPORT_ID", s.api.sport_id);
    s.api.transfer_timeout_seconds = env_int_or("MLD_HTTP_TIMEOUT", s.api.transfer_timeout_seconds);

    s.service.worker_threads = env_int_or("MLD_WORKER_THREADS", s.service.worker_threads);
    s.output.format = env_or("MLD_OUTPUT_FORMAT", s.output.format);
    s.output.directory = env_or("MLD_OUTPUT_DIRECTORY", s.output.directory);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.service.worker_threads = 1;
    s.output.directory = "data/dev";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.service.worker_threads = 4;
    s.output.format = "parquet";
    s.output.directory = "data/prod";
    return s;
}

} // namespace mld::config
