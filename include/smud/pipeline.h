/**
 * Smud Pipeline Specialization & Cache
 *
 * Every distinct (sdf, fill, blend mode, target format, sample count)
 * combination needs its own GPU pipeline. Compiling one is the host's
 * business: the cache talks to it through Smud_PipelineSpecializer, a small
 * function table that hands back a handle immediately and finishes the
 * pipeline whenever it likes.
 *
 * The cache is owned by whoever prepares batches (normally the renderer)
 * and lives as long as it does. Entries are created on first use and never
 * evicted or invalidated.
 *
 * Usage:
 *   Smud_PipelineSpecializer spec = smud_gpu_specializer_interface(gs);
 *   Smud_PipelineCache *cache = smud_pipeline_cache_create(&spec);
 *
 *   Smud_PipelineHandle h = smud_pipeline_cache_get_or_create(cache, &key);
 *   if (smud_pipeline_cache_is_ready(cache, h)) { ... draw ... }
 *
 *   smud_pipeline_cache_destroy(cache);
 */

#ifndef SMUD_PIPELINE_H
#define SMUD_PIPELINE_H

#include "smud/shape.h"
#include <SDL3/SDL.h>
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Keys, Handles, States
 * ============================================================================ */

typedef struct Smud_PipelineKey {
    Smud_ShaderId sdf;
    Smud_ShaderId fill;
    Smud_BlendMode blend_mode;
    SDL_GPUTextureFormat target_format;
    SDL_GPUSampleCount sample_count;
} Smud_PipelineKey;

/** Specialized pipeline handle. 0 = invalid. */
typedef struct Smud_PipelineHandle {
    uint32_t value;
} Smud_PipelineHandle;

#define SMUD_PIPELINE_HANDLE_INVALID { 0 }

typedef enum Smud_PipelineState {
    SMUD_PIPELINE_INVALID = 0,  /* Unknown handle */
    SMUD_PIPELINE_PENDING,      /* Queued or compiling */
    SMUD_PIPELINE_READY,        /* Usable for drawing */
    SMUD_PIPELINE_FAILED        /* Compilation failed; never becomes ready */
} Smud_PipelineState;

bool smud_pipeline_key_equals(const Smud_PipelineKey *a, const Smud_PipelineKey *b);

/**
 * Total order over the shader part of a key: (sdf, fill), then blend mode.
 */
int smud_pipeline_key_compare_shaders(const Smud_PipelineKey *a, const Smud_PipelineKey *b);

bool smud_pipeline_handle_is_valid(Smud_PipelineHandle handle);

/* ============================================================================
 * Specializer Interface
 * ============================================================================ */

/**
 * Host pipeline facility.
 *
 * specialize: Called once per new key. Returns a handle that may still be
 *             pending, or an invalid handle if the key cannot be served yet
 *             (for example a shader that is not loaded). Must not block.
 * get_state:  Current state of a handle.
 * resolve:    GPU pipeline of a READY handle. Optional; draw submission
 *             needs it, batching does not.
 */
typedef struct Smud_PipelineSpecializer {
    Smud_PipelineHandle (*specialize)(void *userdata, const Smud_PipelineKey *key);
    Smud_PipelineState (*get_state)(void *userdata, Smud_PipelineHandle handle);
    SDL_GPUGraphicsPipeline *(*resolve)(void *userdata, Smud_PipelineHandle handle);
    void *userdata;
} Smud_PipelineSpecializer;

/* ============================================================================
 * Pipeline Cache
 * ============================================================================ */

typedef struct Smud_PipelineCache Smud_PipelineCache;

typedef struct Smud_PipelineCacheStats {
    uint64_t hits;                  /* get_or_create served from the table */
    uint64_t misses;                /* Key not in the table */
    uint64_t specialize_requests;   /* Calls into the specializer, one per miss */
    uint64_t specialize_failures;   /* specialize returned an invalid handle */
    size_t entries;
} Smud_PipelineCacheStats;

/**
 * Create an empty cache. The specializer table is copied; its userdata
 * must outlive the cache.
 *
 * @return New cache, or NULL on failure (error set)
 */
Smud_PipelineCache *smud_pipeline_cache_create(const Smud_PipelineSpecializer *specializer);

void smud_pipeline_cache_destroy(Smud_PipelineCache *cache);

/**
 * Look up the pipeline for key, specializing it on first use.
 * The only call that modifies the cache. Valid handles are stored for the
 * cache's lifetime; invalid ones are not stored, so the next call retries.
 *
 * @return Stored or new handle, or an invalid handle
 */
Smud_PipelineHandle smud_pipeline_cache_get_or_create(Smud_PipelineCache *cache,
                                                      const Smud_PipelineKey *key);

/**
 * Look up without specializing.
 *
 * @return Stored handle, or an invalid handle if the key was never cached
 */
Smud_PipelineHandle smud_pipeline_cache_find(const Smud_PipelineCache *cache,
                                             const Smud_PipelineKey *key);

Smud_PipelineState smud_pipeline_cache_get_state(const Smud_PipelineCache *cache,
                                                 Smud_PipelineHandle handle);

bool smud_pipeline_cache_is_ready(const Smud_PipelineCache *cache, Smud_PipelineHandle handle);

/**
 * GPU pipeline for a ready handle.
 *
 * @return Pipeline, or NULL if not ready or the specializer has no resolve
 */
SDL_GPUGraphicsPipeline *smud_pipeline_cache_resolve(const Smud_PipelineCache *cache,
                                                     Smud_PipelineHandle handle);

size_t smud_pipeline_cache_count(const Smud_PipelineCache *cache);

void smud_pipeline_cache_get_stats(const Smud_PipelineCache *cache, Smud_PipelineCacheStats *out);

#ifdef __cplusplus
}
#endif

#endif /* SMUD_PIPELINE_H */
