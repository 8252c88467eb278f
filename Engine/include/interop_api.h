#pragma once

#include <export.hpp>

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage
LOOKALIKE_API const char* lookalike_get_last_error();
LOOKALIKE_API const char* lookalike_get_version();

// =============================================================================
//  Opaque Handles
// =============================================================================

typedef void* h_engine_t;

// =============================================================================
//  Common Types
// =============================================================================

typedef enum {
    L_KIND_NEW_MATCH = 0,
    L_KIND_NOT_DUPLICATE = 1,
    L_KIND_NEAR_DUPLICATE = 2,
    L_KIND_SIMILAR = 3,
    L_KIND_SAME_SET = 4
} L_RELATION_KIND;

typedef enum {
    L_ERROR_NOT_FOUND = 0,
    L_ERROR_CONSTRAINT_VIOLATION = 1,
    L_ERROR_TRANSIENT = 2,
    L_ERROR_INTEGRITY_ANOMALY = 3,
    L_ERROR_INVALID_TRANSITION = 4
} L_ERROR_KIND;

typedef struct LRelation {
    int64_t a;
    int64_t b;
    uint32_t distance;
    int kind;               // L_RELATION_KIND
    int64_t created_at;     // epoch seconds
} LRelation;

typedef struct LScanWarning {
    int64_t a;
    int64_t b;
    int error_kind;         // L_ERROR_KIND
    char* reason;
} LScanWarning;

typedef struct LScanResult {
    LRelation* relations;
    size_t relations_count;
    LScanWarning* warnings;
    size_t warnings_count;
    size_t write_failures;
    size_t orphans_swept;
    size_t inserted;
    size_t existing;
    bool cancelled;
    double elapsed_ms;
} LScanResult;

// =============================================================================
//  Engine
// =============================================================================

// config_path: JSON config file, or NULL to configure from the environment.
// Creates the storage tables if they do not exist.
LOOKALIKE_API h_engine_t lookalike_engine_create(const char* config_path);
LOOKALIKE_API void lookalike_engine_destroy(h_engine_t handle);

// =============================================================================
//  Scanner / Deletion Collaborators
// =============================================================================

LOOKALIKE_API bool lookalike_register_item(h_engine_t handle, int64_t id, const char* fingerprint_hex, const char* source);
LOOKALIKE_API bool lookalike_item_deleted(h_engine_t handle, int64_t id);

// =============================================================================
//  Presentation Collaborators
// =============================================================================

// roots may be NULL when roots_count is 0 (no scope restriction).
LOOKALIKE_API bool lookalike_find_duplicates(h_engine_t handle, uint32_t threshold,
                                             const char* const* roots, size_t roots_count,
                                             bool include_annotated, LScanResult* out_result);
LOOKALIKE_API void lookalike_free_scan_result(LScanResult* result);

// Safe to call from another thread while lookalike_find_duplicates runs.
LOOKALIKE_API bool lookalike_cancel_scan(h_engine_t handle);

// L_KIND_NEW_MATCH is a reset, allowed only when the engine's policy permits it.
LOOKALIKE_API bool lookalike_annotate(h_engine_t handle, int64_t a, int64_t b, int kind);

// Returns the L_RELATION_KIND of the pair, -1 if no relation exists, -2 on error.
LOOKALIKE_API int lookalike_get_kind(h_engine_t handle, int64_t a, int64_t b);

// Returns the number of orphans removed, or -1 on error.
LOOKALIKE_API int64_t lookalike_integrity_check(h_engine_t handle);

#ifdef __cplusplus
}
#endif
