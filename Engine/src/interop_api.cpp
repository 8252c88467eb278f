#include <interop_api.h>
#include <config/engine_config.hpp>
#include <dedup/duplicate_engine.hpp>
#include <storage/relation_store.hpp>
#include <stdexcept>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <new>
#include <string>
#include <vector>

// Thread-local error storage
thread_local std::string g_last_error;

const char* lookalike_get_last_error() {
    return g_last_error.c_str();
}

const char* lookalike_get_version() {
    return "0.3.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
}

// Variadic: brace initializers in the body contain bare commas
#define INTEROP_TRY_CATCH(...) \
    try { \
        __VA_ARGS__ \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define INTEROP_TRY_CATCH_PTR(...) \
    try { \
        __VA_ARGS__ \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

// Helper for string duplication
static char* strdup_safe(const std::string& str) {
#ifdef _WIN32
    return _strdup(str.c_str());
#else
    return strdup(str.c_str());
#endif
}

namespace {

struct EngineHandle {
    Lookalike::EngineConfig config;
    std::unique_ptr<Lookalike::RelationStore> store;
    std::unique_ptr<Lookalike::DuplicateEngine> engine;
    Lookalike::CancellationToken cancel;
};

EngineHandle* as_engine(h_engine_t handle) {
    if (!handle) throw std::invalid_argument("Invalid engine handle");
    return static_cast<EngineHandle*>(handle);
}

Lookalike::RelationKind kind_from_c(int kind) {
    switch (kind) {
        case L_KIND_NEW_MATCH:       return Lookalike::RelationKind::NewMatch;
        case L_KIND_NOT_DUPLICATE:   return Lookalike::RelationKind::NotDuplicate;
        case L_KIND_NEAR_DUPLICATE:  return Lookalike::RelationKind::NearDuplicate;
        case L_KIND_SIMILAR:         return Lookalike::RelationKind::Similar;
        case L_KIND_SAME_SET:        return Lookalike::RelationKind::SameSet;
    }
    throw std::invalid_argument("Unknown relation kind " + std::to_string(kind));
}

int kind_to_c(Lookalike::RelationKind kind) {
    switch (kind) {
        case Lookalike::RelationKind::NewMatch:      return L_KIND_NEW_MATCH;
        case Lookalike::RelationKind::NotDuplicate:  return L_KIND_NOT_DUPLICATE;
        case Lookalike::RelationKind::NearDuplicate: return L_KIND_NEAR_DUPLICATE;
        case Lookalike::RelationKind::Similar:       return L_KIND_SIMILAR;
        case Lookalike::RelationKind::SameSet:       return L_KIND_SAME_SET;
    }
    return L_KIND_NEW_MATCH;
}

// Frees the reason strings of a partly built warning array
struct WarningArrayDeleter {
    size_t count;
    void operator()(LScanWarning* warnings) const {
        for (size_t i = 0; i < count; ++i) free(warnings[i].reason);
        delete[] warnings;
    }
};

int error_to_c(Lookalike::ErrorKind kind) {
    switch (kind) {
        case Lookalike::ErrorKind::NotFound:              return L_ERROR_NOT_FOUND;
        case Lookalike::ErrorKind::ConstraintViolation:   return L_ERROR_CONSTRAINT_VIOLATION;
        case Lookalike::ErrorKind::TransientStorageError: return L_ERROR_TRANSIENT;
        case Lookalike::ErrorKind::IntegrityAnomaly:      return L_ERROR_INTEGRITY_ANOMALY;
        case Lookalike::ErrorKind::InvalidTransition:     return L_ERROR_INVALID_TRANSITION;
    }
    return L_ERROR_TRANSIENT;
}

} // namespace

// =============================================================================
//  Engine
// =============================================================================

h_engine_t lookalike_engine_create(const char* config_path) {
    INTEROP_TRY_CATCH_PTR({
        auto handle = std::make_unique<EngineHandle>();
        handle->config = (config_path && *config_path)
            ? Lookalike::EngineConfig::from_file(config_path)
            : Lookalike::EngineConfig::from_env();
        handle->store = Lookalike::open_relation_store(handle->config);
        handle->store->initialize();
        handle->engine = std::make_unique<Lookalike::DuplicateEngine>(*handle->store, handle->config);
        return static_cast<h_engine_t>(handle.release());
    })
}

void lookalike_engine_destroy(h_engine_t handle) {
    if (handle) {
        delete static_cast<EngineHandle*>(handle);
    }
}

// =============================================================================
//  Scanner / Deletion Collaborators
// =============================================================================

bool lookalike_register_item(h_engine_t handle, int64_t id, const char* fingerprint_hex, const char* source) {
    INTEROP_TRY_CATCH({
        if (!fingerprint_hex) throw std::invalid_argument("Invalid parameters");
        auto* h = as_engine(handle);

        Lookalike::Item item;
        item.id = id;
        item.fingerprint = Lookalike::Fingerprint::from_hex(fingerprint_hex, h->config.fingerprint_bits);
        item.source = source ? source : "";

        auto result = h->engine->register_items({item});
        if (!result.failures.empty()) {
            throw Lookalike::StoreError(result.failures.front().kind, result.failures.front().reason);
        }
        return true;
    })
}

bool lookalike_item_deleted(h_engine_t handle, int64_t id) {
    INTEROP_TRY_CATCH({
        as_engine(handle)->engine->item_deleted(id);
        return true;
    })
}

// =============================================================================
//  Presentation Collaborators
// =============================================================================

bool lookalike_find_duplicates(h_engine_t handle, uint32_t threshold,
                               const char* const* roots, size_t roots_count,
                               bool include_annotated, LScanResult* out_result) {
    INTEROP_TRY_CATCH({
        if (!out_result) throw std::invalid_argument("Invalid parameters");
        std::memset(out_result, 0, sizeof(LScanResult));
        if (roots_count > 0 && !roots) throw std::invalid_argument("Invalid parameters");
        auto* h = as_engine(handle);

        std::vector<std::string> scope_roots;
        for (size_t i = 0; i < roots_count; ++i) {
            if (roots[i]) scope_roots.emplace_back(roots[i]);
        }

        Lookalike::ScanRequest request;
        request.threshold = threshold;
        request.scope = Lookalike::SourceScope(scope_roots);
        request.include_annotated = include_annotated;
        request.cancel = &h->cancel;
        h->cancel.reset();

        auto report = h->engine->find_duplicates(request);

        // Build both arrays before handing either to the caller
        std::unique_ptr<LRelation[]> relations;
        if (!report.relations.empty()) {
            relations.reset(new LRelation[report.relations.size()]);
            for (size_t i = 0; i < report.relations.size(); ++i) {
                const auto& rel = report.relations[i];
                relations[i] = LRelation{rel.pair.a, rel.pair.b, rel.distance, kind_to_c(rel.kind), rel.created_at};
            }
        }
        std::unique_ptr<LScanWarning[], WarningArrayDeleter> warnings(nullptr, WarningArrayDeleter{0});
        if (!report.warnings.empty()) {
            warnings = std::unique_ptr<LScanWarning[], WarningArrayDeleter>(
                new LScanWarning[report.warnings.size()](), WarningArrayDeleter{report.warnings.size()});
            for (size_t i = 0; i < report.warnings.size(); ++i) {
                const auto& w = report.warnings[i];
                char* reason = strdup_safe(w.reason);
                if (!reason) throw std::bad_alloc();
                warnings[i] = LScanWarning{w.pair.a, w.pair.b, error_to_c(w.kind), reason};
            }
        }

        out_result->relations_count = report.relations.size();
        out_result->relations = relations.release();
        out_result->warnings_count = report.warnings.size();
        out_result->warnings = warnings.release();
        out_result->write_failures = report.failures.size();
        out_result->orphans_swept = report.orphans_swept;
        out_result->inserted = report.inserted;
        out_result->existing = report.existing;
        out_result->cancelled = report.cancelled;
        out_result->elapsed_ms = report.elapsed_ms;
        return true;
    })
}

void lookalike_free_scan_result(LScanResult* result) {
    if (!result) return;

    delete[] result->relations;

    if (result->warnings) {
        for (size_t i = 0; i < result->warnings_count; ++i) {
            if (result->warnings[i].reason) free(result->warnings[i].reason);
        }
        delete[] result->warnings;
    }

    result->relations = nullptr;
    result->relations_count = 0;
    result->warnings = nullptr;
    result->warnings_count = 0;
}

bool lookalike_cancel_scan(h_engine_t handle) {
    INTEROP_TRY_CATCH({
        as_engine(handle)->cancel.cancel();
        return true;
    })
}

bool lookalike_annotate(h_engine_t handle, int64_t a, int64_t b, int kind) {
    INTEROP_TRY_CATCH({
        as_engine(handle)->engine->annotate(Lookalike::PairKey::make(a, b), kind_from_c(kind));
        return true;
    })
}

int lookalike_get_kind(h_engine_t handle, int64_t a, int64_t b) {
    try {
        auto kind = as_engine(handle)->store->get_kind(Lookalike::PairKey::make(a, b));
        return kind ? kind_to_c(*kind) : -1;
    } catch (const std::exception& e) {
        set_error(e);
        return -2;
    }
}

int64_t lookalike_integrity_check(h_engine_t handle) {
    try {
        return static_cast<int64_t>(as_engine(handle)->engine->integrity_check());
    } catch (const std::exception& e) {
        set_error(e);
        return -1;
    }
}
