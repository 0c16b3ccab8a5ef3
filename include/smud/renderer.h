/**
 * Smud Shape Renderer
 *
 * Per-frame driver on top of SDL3 GPU: extracts shapes from a flecs world,
 * batches them per view, uploads the instance buffer and issues one
 * instanced draw per batch.
 *
 * Frame flow:
 *   smud_gpu_specializer_process(gs);                  // finish queued pipelines
 *   smud_renderer_prepare(r, world, &view, 1);          // extract + batch
 *
 *   SDL_GPUCommandBuffer *cmd = SDL_AcquireGPUCommandBuffer(gpu);
 *   smud_renderer_upload(r, cmd);                       // before the render pass
 *   SDL_GPURenderPass *pass = SDL_BeginGPURenderPass(cmd, &target, 1, NULL);
 *   smud_renderer_draw(r, cmd, pass, 0, &uniforms);
 *   SDL_EndGPURenderPass(pass);
 *   SDL_SubmitGPUCommandBuffer(cmd);
 *
 * The GPU specializer compiles one pipeline per pipeline key from opaque
 * shader blobs the host registers: one shared vertex shader and one
 * fragment shader per (sdf, fill) pair. Shader source generation and
 * cross-compilation happen before the blobs reach this module.
 */

#ifndef SMUD_RENDERER_H
#define SMUD_RENDERER_H

#include "smud/batch.h"
#include "smud/extract.h"
#include "smud/pipeline.h"
#include "flecs.h"
#include <SDL3/SDL.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Renderer
 * ============================================================================ */

typedef struct Smud_ShapeRenderer Smud_ShapeRenderer;

typedef struct Smud_RendererConfig {
    uint32_t initial_instance_capacity;     /* GPU buffer size in instances */
} Smud_RendererConfig;

#define SMUD_RENDERER_CONFIG_DEFAULT { \
    .initial_instance_capacity = 1024 \
}

/** Vertex uniform block, slot 0. */
typedef struct Smud_ViewUniforms {
    float view_projection[16];
    float time;                 /* Seconds, for animated fills */
    float padding[3];
} Smud_ViewUniforms;

/**
 * Create a renderer.
 * gpu may be NULL for CPU-only preparation (upload and draw then do nothing).
 *
 * @param gpu         SDL GPU device (borrowed)
 * @param specializer Pipeline facility; copied, userdata must outlive the renderer
 * @param config      Configuration, or NULL for defaults
 * @return New renderer, or NULL on failure (error set)
 */
Smud_ShapeRenderer *smud_renderer_create(SDL_GPUDevice *gpu,
                                         const Smud_PipelineSpecializer *specializer,
                                         const Smud_RendererConfig *config);

void smud_renderer_destroy(Smud_ShapeRenderer *renderer);

/**
 * Extract the world and build vertices and batches for each view.
 * View i of this call is view index i for smud_renderer_draw().
 *
 * @return false on allocation failure (error set)
 */
bool smud_renderer_prepare(Smud_ShapeRenderer *renderer, ecs_world_t *world,
                           const Smud_RenderView *views, int view_count);

/**
 * Upload the packed instances through a copy pass. Must be called outside
 * a render pass. Grows the GPU buffer as needed.
 *
 * @return false on GPU failure (error set)
 */
bool smud_renderer_upload(Smud_ShapeRenderer *renderer, SDL_GPUCommandBuffer *cmd);

/**
 * Draw the batches of one view in sorted order.
 *
 * @return Number of draw calls issued
 */
int smud_renderer_draw(Smud_ShapeRenderer *renderer, SDL_GPUCommandBuffer *cmd,
                       SDL_GPURenderPass *pass, int view_index,
                       const Smud_ViewUniforms *uniforms);

Smud_ShapeBatcher *smud_renderer_get_batcher(Smud_ShapeRenderer *renderer);
Smud_PipelineCache *smud_renderer_get_pipeline_cache(Smud_ShapeRenderer *renderer);
const Smud_ExtractedShapes *smud_renderer_get_extracted(const Smud_ShapeRenderer *renderer);

/* ============================================================================
 * SDL GPU Specializer
 * ============================================================================ */

typedef struct Smud_GpuSpecializer Smud_GpuSpecializer;

/** Compiled shader bytes in a format the device accepts. Copied on register. */
typedef struct Smud_ShaderBlob {
    const uint8_t *code;
    size_t code_size;
    const char *entrypoint;
    SDL_GPUShaderFormat format;
    uint32_t num_uniform_buffers;
} Smud_ShaderBlob;

/**
 * Builds one pipeline for key. Returns NULL on failure with the error set;
 * the slot then becomes FAILED.
 */
typedef SDL_GPUGraphicsPipeline *(*Smud_PipelineBuildFn)(void *userdata, const Smud_PipelineKey *key);
typedef void (*Smud_PipelineReleaseFn)(void *userdata, SDL_GPUGraphicsPipeline *pipeline);

typedef struct Smud_GpuSpecializerConfig {
    int compile_budget;             /* Pipelines compiled per process() call; <= 0 = all */

    /* Replaces SDL_CreateGPUGraphicsPipeline from the registered blobs */
    Smud_PipelineBuildFn build;
    Smud_PipelineReleaseFn release;
    void *build_userdata;
} Smud_GpuSpecializerConfig;

#define SMUD_GPU_SPECIALIZER_CONFIG_DEFAULT { \
    .compile_budget = 4, \
    .build = NULL, \
    .release = NULL, \
    .build_userdata = NULL \
}

/**
 * @param gpu Device, or NULL when config supplies a build function
 * @return New specializer, or NULL without a device or builder, or on
 *         allocation failure
 */
Smud_GpuSpecializer *smud_gpu_specializer_create(SDL_GPUDevice *gpu,
                                                 const Smud_GpuSpecializerConfig *config);

/** Release every pipeline it created. */
void smud_gpu_specializer_destroy(Smud_GpuSpecializer *gs);

/** Set the vertex shader shared by all shape pipelines. */
bool smud_gpu_specializer_set_vertex_shader(Smud_GpuSpecializer *gs, const Smud_ShaderBlob *blob);

/**
 * Register (or replace) the fragment shader of a shader pair. Until a pair
 * is registered, specialize() returns an invalid handle for it.
 */
bool smud_gpu_specializer_register_fragment(Smud_GpuSpecializer *gs,
                                            Smud_ShaderId sdf, Smud_ShaderId fill,
                                            const Smud_ShaderBlob *blob);

/**
 * Compile queued pipelines, up to the configured budget.
 *
 * @return Number of pipelines that became READY
 */
int smud_gpu_specializer_process(Smud_GpuSpecializer *gs);

/** Number of pipelines still waiting in the queue. */
int smud_gpu_specializer_pending_count(const Smud_GpuSpecializer *gs);

/** Function table for smud_pipeline_cache_create() / smud_renderer_create(). */
Smud_PipelineSpecializer smud_gpu_specializer_interface(Smud_GpuSpecializer *gs);

#ifdef __cplusplus
}
#endif

#endif /* SMUD_RENDERER_H */
