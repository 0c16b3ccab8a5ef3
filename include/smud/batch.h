/**
 * Smud Shape Batching
 *
 * Turns an extraction snapshot into a packed instance buffer plus an ordered
 * list of draw batches.
 *
 * For each render view the snapshot is sorted back to front (ascending z;
 * equal z falls back to shader pair, blend mode, then entity id) and walked
 * once. A batch is a run of consecutive entries that share the pipeline key
 * AND the exact z value. Runs whose pipeline is not ready yet are dropped
 * for this frame: no vertices, no batch.
 *
 * Vertices for all views of a frame go into one buffer; each view owns a
 * contiguous range of batches. smud_batcher_begin() clears everything.
 *
 * Usage:
 *   smud_batcher_begin(batcher);
 *   int view = smud_batcher_prepare_view(batcher, &snapshot, cache, &rv);
 *
 *   size_t first, count;
 *   smud_batcher_get_view_batches(batcher, view, &first, &count);
 */

#ifndef SMUD_BATCH_H
#define SMUD_BATCH_H

#include "smud/extract.h"
#include "smud/pipeline.h"
#include <SDL3/SDL.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * One record per shape instance, read by the vertex stage at instance rate.
 * Tightly packed floats; uploaded byte for byte.
 *
 * Locations: position 0, color 1, params 2, rotation 3, scale 4, frame 5.
 */
typedef struct Smud_ShapeVertex {
    float color[4];     /* Linear RGBA */
    float frame;        /* Quad half extent */
    float params[4];
    float position[3];  /* World translation */
    float rotation[2];  /* Unit direction of local +X */
    float scale;
} Smud_ShapeVertex;

typedef struct Smud_ShapeBatch {
    uint32_t first_instance;
    uint32_t instance_count;
    Smud_PipelineKey key;
    Smud_PipelineHandle pipeline;
    float sort_key;             /* z shared by every instance in the batch */
} Smud_ShapeBatch;

/** Target description of one camera pass. */
typedef struct Smud_RenderView {
    SDL_GPUTextureFormat target_format;
    SDL_GPUSampleCount sample_count;
} Smud_RenderView;

typedef struct Smud_BatchStats {
    size_t shapes;      /* Instances packed this frame */
    size_t batches;
    size_t skipped;     /* Instances dropped because their pipeline was not ready */
    size_t views;
} Smud_BatchStats;

typedef struct Smud_ShapeBatcher Smud_ShapeBatcher;

/* ============================================================================
 * Sorting & Packing
 * ============================================================================ */

/**
 * qsort comparator over Smud_ExtractedShape: z ascending, then (sdf, fill),
 * then blend mode, then entity id.
 */
int smud_extracted_shape_compare(const void *a, const void *b);

void smud_sort_extracted_shapes(Smud_ExtractedShapes *shapes);

void smud_pack_shape_vertex(const Smud_ExtractedShape *shape, Smud_ShapeVertex *out);

/* ============================================================================
 * Batcher
 * ============================================================================ */

Smud_ShapeBatcher *smud_batcher_create(void);
void smud_batcher_destroy(Smud_ShapeBatcher *batcher);

/** Clear vertices, batches, views and stats for a new frame. */
void smud_batcher_begin(Smud_ShapeBatcher *batcher);

/**
 * Sort the snapshot in place and append the vertices and batches of one
 * view. Pipelines are requested through the cache as runs start.
 *
 * @return View index, or -1 on failure (error set)
 */
int smud_batcher_prepare_view(Smud_ShapeBatcher *batcher,
                              Smud_ExtractedShapes *shapes,
                              Smud_PipelineCache *cache,
                              const Smud_RenderView *view);

const Smud_ShapeVertex *smud_batcher_get_vertices(const Smud_ShapeBatcher *batcher, size_t *out_count);
const Smud_ShapeBatch *smud_batcher_get_batches(const Smud_ShapeBatcher *batcher, size_t *out_count);

/**
 * True when every instance of batch lies in the first vertex_count records.
 * A batch prepared after the last upload may reach past the GPU buffer.
 */
bool smud_batch_fits(const Smud_ShapeBatch *batch, size_t vertex_count);

size_t smud_batcher_get_view_count(const Smud_ShapeBatcher *batcher);

/**
 * Batch range of one view.
 *
 * @return false if view_index is out of range
 */
bool smud_batcher_get_view_batches(const Smud_ShapeBatcher *batcher, int view_index,
                                   size_t *out_first, size_t *out_count);

void smud_batcher_get_stats(const Smud_ShapeBatcher *batcher, Smud_BatchStats *out);

#ifdef __cplusplus
}
#endif

#endif /* SMUD_BATCH_H */
