#include "smud/smud.h"
#include "smud/batch.h"
#include <string.h>

static_assert(sizeof(Smud_ShapeVertex) == 15 * sizeof(float),
              "Smud_ShapeVertex must stay tightly packed");

#define BATCHER_INITIAL_VERTICES 256
#define BATCHER_INITIAL_BATCHES 32
#define BATCHER_INITIAL_VIEWS 4

typedef struct ViewRange {
    size_t first_batch;
    size_t batch_count;
} ViewRange;

struct Smud_ShapeBatcher {
    Smud_ShapeVertex *vertices;
    size_t vertex_count;
    size_t vertex_capacity;

    Smud_ShapeBatch *batches;
    size_t batch_count;
    size_t batch_capacity;

    ViewRange *views;
    size_t view_count;
    size_t view_capacity;

    size_t skipped;
};

/* Open run of entries sharing key and z */
typedef struct BatchRun {
    bool open;
    bool ready;
    Smud_PipelineKey key;
    Smud_PipelineHandle pipeline;
    float z;
    size_t first_vertex;
} BatchRun;

/* ============================================================================
 * Sorting & Packing
 * ============================================================================ */

int smud_extracted_shape_compare(const void *a, const void *b) {
    const Smud_ExtractedShape *sa = (const Smud_ExtractedShape *)a;
    const Smud_ExtractedShape *sb = (const Smud_ExtractedShape *)b;

    if (sa->z < sb->z) return -1;
    if (sa->z > sb->z) return 1;

    int c = smud_shader_pair_compare(sa->sdf, sa->fill, sb->sdf, sb->fill);
    if (c != 0) return c;

    if (sa->blend_mode != sb->blend_mode) {
        return (int)sa->blend_mode < (int)sb->blend_mode ? -1 : 1;
    }

    if (sa->entity < sb->entity) return -1;
    if (sa->entity > sb->entity) return 1;
    return 0;
}

void smud_sort_extracted_shapes(Smud_ExtractedShapes *shapes) {
    if (!shapes || shapes->count < 2) return;
    qsort(shapes->items, shapes->count, sizeof(Smud_ExtractedShape), smud_extracted_shape_compare);
}

void smud_pack_shape_vertex(const Smud_ExtractedShape *shape, Smud_ShapeVertex *out) {
    if (!shape || !out) return;

    smud_color_to_linear(shape->color, out->color);
    out->frame = smud_frame_half_extent(shape->frame);
    memcpy(out->params, shape->params, sizeof(out->params));
    smud_affine_translation(shape->transform, out->position);
    smud_affine_rotation_scale(shape->transform, out->rotation, &out->scale);
}

/* ============================================================================
 * Storage
 * ============================================================================ */

/* Grow *items to hold at least needed elements */
template <typename T>
static bool grow_array(T **items, size_t *capacity, size_t needed,
                       size_t initial, const char *what) {
    if (needed <= *capacity) return true;

    size_t new_capacity = *capacity ? *capacity : initial;
    while (new_capacity < needed) {
        new_capacity *= 2;
    }

    T *grown = SMUD_REALLOC(*items, T, new_capacity);
    if (!grown) {
        smud_set_error("batch: failed to grow %s to %zu", what, new_capacity);
        return false;
    }

    *items = grown;
    *capacity = new_capacity;
    return true;
}

static Smud_ShapeVertex *push_vertex(Smud_ShapeBatcher *b) {
    if (!grow_array(&b->vertices, &b->vertex_capacity, b->vertex_count + 1,
                    BATCHER_INITIAL_VERTICES, "vertices")) {
        return NULL;
    }
    return &b->vertices[b->vertex_count++];
}

static bool close_run(Smud_ShapeBatcher *b, BatchRun *run) {
    if (!run->open) return true;
    run->open = false;

    size_t count = b->vertex_count - run->first_vertex;
    if (!run->ready || count == 0) return true;

    if (!grow_array(&b->batches, &b->batch_capacity, b->batch_count + 1,
                    BATCHER_INITIAL_BATCHES, "batches")) {
        return false;
    }

    Smud_ShapeBatch *batch = &b->batches[b->batch_count++];
    batch->first_instance = (uint32_t)run->first_vertex;
    batch->instance_count = (uint32_t)count;
    batch->key = run->key;
    batch->pipeline = run->pipeline;
    batch->sort_key = run->z;
    return true;
}

/* ============================================================================
 * Batcher
 * ============================================================================ */

Smud_ShapeBatcher *smud_batcher_create(void) {
    Smud_ShapeBatcher *b = SMUD_ALLOC(Smud_ShapeBatcher);
    if (!b) {
        smud_set_error("batch: out of memory");
        return NULL;
    }
    return b;
}

void smud_batcher_destroy(Smud_ShapeBatcher *batcher) {
    if (!batcher) return;
    free(batcher->vertices);
    free(batcher->batches);
    free(batcher->views);
    free(batcher);
}

void smud_batcher_begin(Smud_ShapeBatcher *batcher) {
    if (!batcher) return;
    batcher->vertex_count = 0;
    batcher->batch_count = 0;
    batcher->view_count = 0;
    batcher->skipped = 0;
}

int smud_batcher_prepare_view(Smud_ShapeBatcher *batcher,
                              Smud_ExtractedShapes *shapes,
                              Smud_PipelineCache *cache,
                              const Smud_RenderView *view) {
    if (!batcher || !shapes || !cache || !view) {
        smud_set_error("batch: prepare_view needs batcher, shapes, cache and view");
        return -1;
    }

    if (!grow_array(&batcher->views, &batcher->view_capacity, batcher->view_count + 1,
                    BATCHER_INITIAL_VIEWS, "views")) {
        return -1;
    }

    smud_sort_extracted_shapes(shapes);

    size_t first_batch = batcher->batch_count;
    BatchRun run;
    memset(&run, 0, sizeof(run));

    for (size_t i = 0; i < shapes->count; i++) {
        const Smud_ExtractedShape *s = &shapes->items[i];

        Smud_PipelineKey key;
        memset(&key, 0, sizeof(key));
        key.sdf = s->sdf;
        key.fill = s->fill;
        key.blend_mode = s->blend_mode;
        key.target_format = view->target_format;
        key.sample_count = view->sample_count;

        /* Exact z equality is part of the run identity */
        if (!run.open || s->z != run.z || !smud_pipeline_key_equals(&key, &run.key)) {
            if (!close_run(batcher, &run)) return -1;

            run.open = true;
            run.key = key;
            run.z = s->z;
            run.pipeline = smud_pipeline_cache_get_or_create(cache, &key);
            run.ready = smud_pipeline_cache_is_ready(cache, run.pipeline);
            run.first_vertex = batcher->vertex_count;
        }

        if (!run.ready) {
            batcher->skipped++;
            continue;
        }

        Smud_ShapeVertex *v = push_vertex(batcher);
        if (!v) return -1;
        smud_pack_shape_vertex(s, v);
    }

    if (!close_run(batcher, &run)) return -1;

    ViewRange *range = &batcher->views[batcher->view_count];
    range->first_batch = first_batch;
    range->batch_count = batcher->batch_count - first_batch;
    return (int)batcher->view_count++;
}

const Smud_ShapeVertex *smud_batcher_get_vertices(const Smud_ShapeBatcher *batcher, size_t *out_count) {
    if (out_count) *out_count = batcher ? batcher->vertex_count : 0;
    return batcher ? batcher->vertices : NULL;
}

const Smud_ShapeBatch *smud_batcher_get_batches(const Smud_ShapeBatcher *batcher, size_t *out_count) {
    if (out_count) *out_count = batcher ? batcher->batch_count : 0;
    return batcher ? batcher->batches : NULL;
}

bool smud_batch_fits(const Smud_ShapeBatch *batch, size_t vertex_count) {
    if (!batch) return false;
    return (size_t)batch->first_instance + batch->instance_count <= vertex_count;
}

size_t smud_batcher_get_view_count(const Smud_ShapeBatcher *batcher) {
    return batcher ? batcher->view_count : 0;
}

bool smud_batcher_get_view_batches(const Smud_ShapeBatcher *batcher, int view_index,
                                   size_t *out_first, size_t *out_count) {
    if (!batcher || view_index < 0 || (size_t)view_index >= batcher->view_count) return false;

    const ViewRange *range = &batcher->views[view_index];
    if (out_first) *out_first = range->first_batch;
    if (out_count) *out_count = range->batch_count;
    return true;
}

void smud_batcher_get_stats(const Smud_ShapeBatcher *batcher, Smud_BatchStats *out) {
    if (!out) return;
    memset(out, 0, sizeof(*out));
    if (!batcher) return;

    out->shapes = batcher->vertex_count;
    out->batches = batcher->batch_count;
    out->skipped = batcher->skipped;
    out->views = batcher->view_count;
}
