#include "smud/smud.h"
#include "smud/pipeline.h"
#include <string.h>

#define CACHE_INITIAL_CAPACITY 32   /* Must be a power of 2 */
#define CACHE_LOAD_FACTOR 0.75f

/* Open-addressing slot. hash 0 marks an empty slot */
typedef struct CacheEntry {
    uint32_t hash;
    Smud_PipelineKey key;
    Smud_PipelineHandle handle;
} CacheEntry;

struct Smud_PipelineCache {
    Smud_PipelineSpecializer specializer;

    CacheEntry *entries;
    size_t capacity;
    size_t count;

    uint64_t hits;
    uint64_t misses;
    uint64_t specialize_requests;
    uint64_t specialize_failures;
};

/* ============================================================================
 * Key Helpers
 * ============================================================================ */

bool smud_pipeline_key_equals(const Smud_PipelineKey *a, const Smud_PipelineKey *b) {
    if (!a || !b) return false;
    return a->sdf.value == b->sdf.value &&
           a->fill.value == b->fill.value &&
           a->blend_mode == b->blend_mode &&
           a->target_format == b->target_format &&
           a->sample_count == b->sample_count;
}

int smud_pipeline_key_compare_shaders(const Smud_PipelineKey *a, const Smud_PipelineKey *b) {
    int c = smud_shader_pair_compare(a->sdf, a->fill, b->sdf, b->fill);
    if (c != 0) return c;
    return (int)a->blend_mode - (int)b->blend_mode;
}

bool smud_pipeline_handle_is_valid(Smud_PipelineHandle handle) {
    return handle.value != 0;
}

/* FNV-1a over the key fields; padding never enters the hash */
static uint32_t hash_bytes(uint32_t hash, const void *data, size_t size) {
    const uint8_t *p = (const uint8_t *)data;
    for (size_t i = 0; i < size; i++) {
        hash ^= p[i];
        hash *= 16777619u;
    }
    return hash;
}

static uint32_t hash_key(const Smud_PipelineKey *key) {
    uint32_t hash = 2166136261u;
    uint32_t blend = (uint32_t)key->blend_mode;
    uint32_t format = (uint32_t)key->target_format;
    uint32_t samples = (uint32_t)key->sample_count;

    hash = hash_bytes(hash, &key->sdf.value, sizeof(key->sdf.value));
    hash = hash_bytes(hash, &key->fill.value, sizeof(key->fill.value));
    hash = hash_bytes(hash, &blend, sizeof(blend));
    hash = hash_bytes(hash, &format, sizeof(format));
    hash = hash_bytes(hash, &samples, sizeof(samples));
    return hash ? hash : 1;
}

/* ============================================================================
 * Table
 * ============================================================================ */

static const CacheEntry *table_find(const Smud_PipelineCache *cache,
                                    const Smud_PipelineKey *key, uint32_t hash) {
    size_t mask = cache->capacity - 1;
    size_t idx = hash & mask;

    /* The table is never full, so an empty slot ends every probe */
    while (cache->entries[idx].hash != 0) {
        const CacheEntry *e = &cache->entries[idx];
        if (e->hash == hash && smud_pipeline_key_equals(&e->key, key)) {
            return e;
        }
        idx = (idx + 1) & mask;
    }
    return NULL;
}

static void table_place(CacheEntry *entries, size_t capacity, const CacheEntry *entry) {
    size_t mask = capacity - 1;
    size_t idx = entry->hash & mask;
    while (entries[idx].hash != 0) {
        idx = (idx + 1) & mask;
    }
    entries[idx] = *entry;
}

static bool table_grow(Smud_PipelineCache *cache) {
    size_t new_capacity = cache->capacity * 2;
    CacheEntry *new_entries = SMUD_ALLOC_ARRAY(CacheEntry, new_capacity);
    if (!new_entries) {
        smud_set_error("pipeline cache: failed to grow table to %zu slots", new_capacity);
        return false;
    }

    for (size_t i = 0; i < cache->capacity; i++) {
        if (cache->entries[i].hash != 0) {
            table_place(new_entries, new_capacity, &cache->entries[i]);
        }
    }

    free(cache->entries);
    cache->entries = new_entries;
    cache->capacity = new_capacity;
    return true;
}

static bool table_insert(Smud_PipelineCache *cache, const Smud_PipelineKey *key,
                         uint32_t hash, Smud_PipelineHandle handle) {
    if ((float)(cache->count + 1) / cache->capacity > CACHE_LOAD_FACTOR) {
        if (!table_grow(cache)) return false;
    }

    CacheEntry entry;
    memset(&entry, 0, sizeof(entry));
    entry.hash = hash;
    entry.key = *key;
    entry.handle = handle;

    table_place(cache->entries, cache->capacity, &entry);
    cache->count++;
    return true;
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Smud_PipelineCache *smud_pipeline_cache_create(const Smud_PipelineSpecializer *specializer) {
    if (!specializer || !specializer->specialize || !specializer->get_state) {
        smud_set_error("pipeline cache: specializer needs specialize and get_state");
        return NULL;
    }

    Smud_PipelineCache *cache = SMUD_ALLOC(Smud_PipelineCache);
    if (!cache) {
        smud_set_error("pipeline cache: out of memory");
        return NULL;
    }

    cache->entries = SMUD_ALLOC_ARRAY(CacheEntry, CACHE_INITIAL_CAPACITY);
    if (!cache->entries) {
        smud_set_error("pipeline cache: out of memory");
        free(cache);
        return NULL;
    }

    cache->specializer = *specializer;
    cache->capacity = CACHE_INITIAL_CAPACITY;
    return cache;
}

void smud_pipeline_cache_destroy(Smud_PipelineCache *cache) {
    if (!cache) return;
    free(cache->entries);
    free(cache);
}

/* ============================================================================
 * Lookup
 * ============================================================================ */

Smud_PipelineHandle smud_pipeline_cache_get_or_create(Smud_PipelineCache *cache,
                                                      const Smud_PipelineKey *key) {
    Smud_PipelineHandle invalid = SMUD_PIPELINE_HANDLE_INVALID;
    if (!cache || !key) return invalid;

    uint32_t hash = hash_key(key);
    const CacheEntry *found = table_find(cache, key, hash);
    if (found) {
        cache->hits++;
        return found->handle;
    }

    cache->misses++;
    cache->specialize_requests++;
    Smud_PipelineHandle handle = cache->specializer.specialize(cache->specializer.userdata, key);
    if (!smud_pipeline_handle_is_valid(handle)) {
        /* Not stored: the next frame asks again */
        cache->specialize_failures++;
        return invalid;
    }

    if (!table_insert(cache, key, hash, handle)) {
        /* The handle is still usable this frame; a later call re-specializes */
        smud_log_and_clear_error(SMUD_LOG_RENDER);
        return handle;
    }

    smud_log_debug(SMUD_LOG_RENDER,
                   "Pipeline %u specialized (sdf %016llx, fill %016llx, blend %d)",
                   handle.value,
                   (unsigned long long)key->sdf.value,
                   (unsigned long long)key->fill.value,
                   (int)key->blend_mode);
    return handle;
}

Smud_PipelineHandle smud_pipeline_cache_find(const Smud_PipelineCache *cache,
                                             const Smud_PipelineKey *key) {
    Smud_PipelineHandle invalid = SMUD_PIPELINE_HANDLE_INVALID;
    if (!cache || !key) return invalid;

    const CacheEntry *found = table_find(cache, key, hash_key(key));
    return found ? found->handle : invalid;
}

Smud_PipelineState smud_pipeline_cache_get_state(const Smud_PipelineCache *cache,
                                                 Smud_PipelineHandle handle) {
    if (!cache || !smud_pipeline_handle_is_valid(handle)) return SMUD_PIPELINE_INVALID;
    return cache->specializer.get_state(cache->specializer.userdata, handle);
}

bool smud_pipeline_cache_is_ready(const Smud_PipelineCache *cache, Smud_PipelineHandle handle) {
    return smud_pipeline_cache_get_state(cache, handle) == SMUD_PIPELINE_READY;
}

SDL_GPUGraphicsPipeline *smud_pipeline_cache_resolve(const Smud_PipelineCache *cache,
                                                     Smud_PipelineHandle handle) {
    if (!cache || !cache->specializer.resolve) return NULL;
    if (!smud_pipeline_cache_is_ready(cache, handle)) return NULL;
    return cache->specializer.resolve(cache->specializer.userdata, handle);
}

size_t smud_pipeline_cache_count(const Smud_PipelineCache *cache) {
    return cache ? cache->count : 0;
}

void smud_pipeline_cache_get_stats(const Smud_PipelineCache *cache, Smud_PipelineCacheStats *out) {
    if (!out) return;
    memset(out, 0, sizeof(*out));
    if (!cache) return;

    out->hits = cache->hits;
    out->misses = cache->misses;
    out->specialize_requests = cache->specialize_requests;
    out->specialize_failures = cache->specialize_failures;
    out->entries = cache->count;
}
