#include <config/engine_config.hpp>
#include <fingerprint/fingerprint.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace Lookalike {

namespace {

bool parse_bool(const std::string& text) {
    std::string v;
    for (char c : text) v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument("Not a boolean: '" + text + "'");
}

template<typename T>
void read_number(const char* name, T& out) {
    const char* env = std::getenv(name);
    if (!env || !*env) return;
    char* end = nullptr;
    long long v = std::strtoll(env, &end, 10);
    if (*end != '\0' || v < 0) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got '" + env + "'");
    }
    out = static_cast<T>(v);
}

void read_string(const char* name, std::string& out) {
    const char* env = std::getenv(name);
    if (env && *env) out = env;
}

} // namespace

EngineConfig EngineConfig::from_env() {
    EngineConfig config;
    config.apply_env();
    config.validate();
    return config;
}

EngineConfig EngineConfig::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
    if (!json.is_object()) {
        throw std::runtime_error("Config file " + path + " must hold a JSON object");
    }

    EngineConfig config;
    try {
        if (json.contains("storage")) {
            const auto& s = json["storage"];
            config.backend = s.value("backend", config.backend);
            config.conninfo = s.value("conninfo", config.conninfo);
            config.schema = s.value("schema", config.schema);
            config.snapshot_path = s.value("snapshot", config.snapshot_path);
            config.retry_attempts = s.value("retry_attempts", config.retry_attempts);
            config.retry_base_ms = s.value("retry_base_ms", config.retry_base_ms);
        }
        if (json.contains("matching")) {
            const auto& m = json["matching"];
            config.fingerprint_bits = m.value("fingerprint_bits", config.fingerprint_bits);
            config.default_threshold = m.value("threshold", config.default_threshold);
            config.mih_slices = m.value("mih_slices", config.mih_slices);
            config.worker_threads = m.value("threads", config.worker_threads);
            config.reconcile_batch_size = m.value("reconcile_batch_size", config.reconcile_batch_size);
        }
        if (json.contains("policy")) {
            const auto& p = json["policy"];
            config.allow_annotation_reset = p.value("allow_annotation_reset", config.allow_annotation_reset);
            config.integrity_check_on_scan = p.value("integrity_check_on_scan", config.integrity_check_on_scan);
            config.rebuild_exclusion_ratio = p.value("rebuild_exclusion_ratio", config.rebuild_exclusion_ratio);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    config.apply_env();
    config.validate();
    return config;
}

void EngineConfig::apply_env() {
    read_string("LOOKALIKE_BACKEND", backend);
    read_string("LOOKALIKE_CONNINFO", conninfo);
    read_string("LOOKALIKE_SCHEMA", schema);
    read_string("LOOKALIKE_SNAPSHOT", snapshot_path);
    read_number("LOOKALIKE_THRESHOLD", default_threshold);
    read_number("LOOKALIKE_MIH_SLICES", mih_slices);
    read_number("LOOKALIKE_THREADS", worker_threads);

    const char* reset = std::getenv("LOOKALIKE_ALLOW_RESET");
    if (reset && *reset) allow_annotation_reset = parse_bool(reset);
}

void EngineConfig::validate() const {
    if (backend != "postgres" && backend != "memory") {
        throw std::invalid_argument("backend must be 'postgres' or 'memory', got '" + backend + "'");
    }
    if (fingerprint_bits == 0 || fingerprint_bits > Fingerprint::MAX_BITS) {
        throw std::invalid_argument("fingerprint_bits must be in 1.." + std::to_string(Fingerprint::MAX_BITS));
    }
    if (default_threshold > fingerprint_bits) {
        throw std::invalid_argument("threshold exceeds fingerprint width");
    }
    if (mih_slices > fingerprint_bits) {
        throw std::invalid_argument("mih_slices exceeds fingerprint width");
    }
    if (mih_slices > 0 && (fingerprint_bits + mih_slices - 1) / mih_slices > 64) {
        throw std::invalid_argument("mih_slices too small: slices wider than 64 bits");
    }
    if (worker_threads < 0) {
        throw std::invalid_argument("threads must be >= 0");
    }
    if (retry_attempts < 1 || retry_attempts > 16 || retry_base_ms < 0) {
        throw std::invalid_argument("retry_attempts must be in 1..16 and retry_base_ms >= 0");
    }
    if (reconcile_batch_size == 0) {
        throw std::invalid_argument("reconcile_batch_size must be > 0");
    }
    if (rebuild_exclusion_ratio < 0.0 || rebuild_exclusion_ratio > 1.0) {
        throw std::invalid_argument("rebuild_exclusion_ratio must be in [0, 1]");
    }
}

} // namespace Lookalike
