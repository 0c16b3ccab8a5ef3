#include "smud/smud.h"
#include "smud/renderer.h"
#include <string.h>

struct Smud_ShapeRenderer {
    SDL_GPUDevice *gpu;

    Smud_PipelineCache *cache;
    Smud_ShapeBatcher *batcher;
    Smud_ExtractedShapes extracted;

    SDL_GPUBuffer *instance_buffer;
    uint32_t instance_capacity;     /* In Smud_ShapeVertex records */
    uint32_t uploaded_count;
    uint32_t initial_capacity;
};

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Smud_ShapeRenderer *smud_renderer_create(SDL_GPUDevice *gpu,
                                         const Smud_PipelineSpecializer *specializer,
                                         const Smud_RendererConfig *config) {
    Smud_RendererConfig defaults = SMUD_RENDERER_CONFIG_DEFAULT;
    if (!config) config = &defaults;

    Smud_ShapeRenderer *r = SMUD_ALLOC(Smud_ShapeRenderer);
    if (!r) {
        smud_set_error("renderer: out of memory");
        return NULL;
    }

    r->gpu = gpu;
    r->initial_capacity = config->initial_instance_capacity > 0
        ? config->initial_instance_capacity : 1;

    r->cache = smud_pipeline_cache_create(specializer);
    if (!r->cache) {
        free(r);
        return NULL;
    }

    r->batcher = smud_batcher_create();
    if (!r->batcher) {
        smud_pipeline_cache_destroy(r->cache);
        free(r);
        return NULL;
    }

    smud_log_info(SMUD_LOG_RENDER, "Shape renderer created%s", gpu ? "" : " (no GPU device)");
    return r;
}

void smud_renderer_destroy(Smud_ShapeRenderer *renderer) {
    if (!renderer) return;

    if (renderer->instance_buffer) {
        SDL_ReleaseGPUBuffer(renderer->gpu, renderer->instance_buffer);
    }

    smud_extracted_shapes_free(&renderer->extracted);
    smud_batcher_destroy(renderer->batcher);
    smud_pipeline_cache_destroy(renderer->cache);
    free(renderer);
}

/* ============================================================================
 * Prepare
 * ============================================================================ */

bool smud_renderer_prepare(Smud_ShapeRenderer *renderer, ecs_world_t *world,
                           const Smud_RenderView *views, int view_count) {
    if (!renderer) return false;

    smud_batcher_begin(renderer->batcher);
    smud_extract_shapes(world, &renderer->extracted);

    for (int i = 0; i < view_count; i++) {
        if (smud_batcher_prepare_view(renderer->batcher, &renderer->extracted,
                                      renderer->cache, &views[i]) < 0) {
            return false;
        }
    }

    Smud_BatchStats stats;
    smud_batcher_get_stats(renderer->batcher, &stats);
    if (stats.skipped > 0) {
        smud_log_debug(SMUD_LOG_RENDER, "%zu shape(s) waiting for pipelines", stats.skipped);
    }
    return true;
}

/* ============================================================================
 * Upload
 * ============================================================================ */

static bool ensure_instance_buffer(Smud_ShapeRenderer *r, uint32_t needed) {
    if (r->instance_buffer && needed <= r->instance_capacity) return true;

    uint32_t capacity = r->instance_capacity ? r->instance_capacity : r->initial_capacity;
    while (capacity < needed) {
        capacity *= 2;
    }

    SDL_GPUBufferCreateInfo info = {
        .usage = SDL_GPU_BUFFERUSAGE_VERTEX,
        .size = (Uint32)(capacity * sizeof(Smud_ShapeVertex)),
        .props = 0
    };
    SDL_GPUBuffer *buffer = SDL_CreateGPUBuffer(r->gpu, &info);
    if (!buffer) {
        smud_set_error_from_sdl("renderer: failed to create instance buffer");
        return false;
    }

    if (r->instance_buffer) {
        SDL_ReleaseGPUBuffer(r->gpu, r->instance_buffer);
    }
    r->instance_buffer = buffer;
    r->instance_capacity = capacity;

    smud_log_debug(SMUD_LOG_RENDER, "Instance buffer grown to %u shapes", capacity);
    return true;
}

bool smud_renderer_upload(Smud_ShapeRenderer *renderer, SDL_GPUCommandBuffer *cmd) {
    if (!renderer || !cmd || !renderer->gpu) return false;

    size_t count = 0;
    const Smud_ShapeVertex *vertices = smud_batcher_get_vertices(renderer->batcher, &count);
    renderer->uploaded_count = 0;
    if (count == 0) return true;

    if (!ensure_instance_buffer(renderer, (uint32_t)count)) return false;

    Uint32 size = (Uint32)(count * sizeof(Smud_ShapeVertex));
    SDL_GPUTransferBufferCreateInfo transfer_info = {
        .usage = SDL_GPU_TRANSFERBUFFERUSAGE_UPLOAD,
        .size = size,
        .props = 0
    };
    SDL_GPUTransferBuffer *transfer = SDL_CreateGPUTransferBuffer(renderer->gpu, &transfer_info);
    if (!transfer) {
        smud_set_error_from_sdl("renderer: failed to create transfer buffer");
        return false;
    }

    void *mapped = SDL_MapGPUTransferBuffer(renderer->gpu, transfer, false);
    if (!mapped) {
        smud_set_error_from_sdl("renderer: failed to map transfer buffer");
        SDL_ReleaseGPUTransferBuffer(renderer->gpu, transfer);
        return false;
    }
    memcpy(mapped, vertices, size);
    SDL_UnmapGPUTransferBuffer(renderer->gpu, transfer);

    SDL_GPUCopyPass *copy_pass = SDL_BeginGPUCopyPass(cmd);
    if (!copy_pass) {
        smud_set_error_from_sdl("renderer: failed to begin copy pass");
        SDL_ReleaseGPUTransferBuffer(renderer->gpu, transfer);
        return false;
    }

    SDL_GPUTransferBufferLocation src = {
        .transfer_buffer = transfer,
        .offset = 0
    };
    SDL_GPUBufferRegion dst = {
        .buffer = renderer->instance_buffer,
        .offset = 0,
        .size = size
    };
    SDL_UploadToGPUBuffer(copy_pass, &src, &dst, true);
    SDL_EndGPUCopyPass(copy_pass);

    SDL_ReleaseGPUTransferBuffer(renderer->gpu, transfer);
    renderer->uploaded_count = (uint32_t)count;
    return true;
}

/* ============================================================================
 * Draw
 * ============================================================================ */

int smud_renderer_draw(Smud_ShapeRenderer *renderer, SDL_GPUCommandBuffer *cmd,
                       SDL_GPURenderPass *pass, int view_index,
                       const Smud_ViewUniforms *uniforms) {
    if (!renderer || !cmd || !pass || !uniforms) return 0;
    if (!renderer->instance_buffer || renderer->uploaded_count == 0) return 0;

    size_t first = 0, count = 0;
    if (!smud_batcher_get_view_batches(renderer->batcher, view_index, &first, &count)) return 0;
    if (count == 0) return 0;

    const Smud_ShapeBatch *batches = smud_batcher_get_batches(renderer->batcher, NULL);

    int draws = 0;
    SDL_GPUGraphicsPipeline *bound = NULL;

    for (size_t i = first; i < first + count; i++) {
        const Smud_ShapeBatch *batch = &batches[i];

        /* Prepared again since the last upload */
        if (!smud_batch_fits(batch, renderer->uploaded_count)) continue;

        SDL_GPUGraphicsPipeline *pipeline = smud_pipeline_cache_resolve(renderer->cache, batch->pipeline);
        if (!pipeline) continue;

        if (pipeline != bound) {
            SDL_BindGPUGraphicsPipeline(pass, pipeline);

            /* Instance buffer and uniforms follow the first pipeline bind */
            if (!bound) {
                SDL_GPUBufferBinding binding = {
                    .buffer = renderer->instance_buffer,
                    .offset = 0
                };
                SDL_BindGPUVertexBuffers(pass, 0, &binding, 1);
                SDL_PushGPUVertexUniformData(cmd, 0, uniforms, sizeof(*uniforms));
            }
            bound = pipeline;
        }

        /* 4-vertex strip expanded per instance in the vertex stage */
        SDL_DrawGPUPrimitives(pass, 4, batch->instance_count, 0, batch->first_instance);
        draws++;
    }

    return draws;
}

/* ============================================================================
 * Accessors
 * ============================================================================ */

Smud_ShapeBatcher *smud_renderer_get_batcher(Smud_ShapeRenderer *renderer) {
    return renderer ? renderer->batcher : NULL;
}

Smud_PipelineCache *smud_renderer_get_pipeline_cache(Smud_ShapeRenderer *renderer) {
    return renderer ? renderer->cache : NULL;
}

const Smud_ExtractedShapes *smud_renderer_get_extracted(const Smud_ShapeRenderer *renderer) {
    return renderer ? &renderer->extracted : NULL;
}
