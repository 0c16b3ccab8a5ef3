#include "smud/smud.h"
#include "smud/renderer.h"
#include <stddef.h>
#include <string.h>

/* Owned copy of a shader blob */
typedef struct StoredBlob {
    uint8_t *code;
    size_t code_size;
    char *entrypoint;
    SDL_GPUShaderFormat format;
    uint32_t num_uniform_buffers;
} StoredBlob;

typedef struct FragmentEntry {
    Smud_ShaderId sdf;
    Smud_ShaderId fill;
    StoredBlob blob;
} FragmentEntry;

/* Handle value is index + 1 */
typedef struct PipelineSlot {
    Smud_PipelineKey key;
    Smud_PipelineState state;
    SDL_GPUGraphicsPipeline *pipeline;
} PipelineSlot;

struct Smud_GpuSpecializer {
    SDL_GPUDevice *gpu;
    int compile_budget;

    Smud_PipelineBuildFn build;
    Smud_PipelineReleaseFn release;
    void *build_userdata;

    bool has_vertex;
    StoredBlob vertex;

    FragmentEntry *fragments;
    size_t fragment_count;
    size_t fragment_capacity;

    PipelineSlot *slots;
    size_t slot_count;
    size_t slot_capacity;

    /* Slots before this index are never pending */
    size_t pending_cursor;
};

/* ============================================================================
 * Blob Storage
 * ============================================================================ */

static void blob_free(StoredBlob *blob) {
    free(blob->code);
    free(blob->entrypoint);
    memset(blob, 0, sizeof(*blob));
}

static bool blob_copy(StoredBlob *dst, const Smud_ShaderBlob *src) {
    if (!src || !src->code || src->code_size == 0) {
        smud_set_error("gpu specializer: empty shader blob");
        return false;
    }

    const char *entry = src->entrypoint ? src->entrypoint : "main";
    size_t entry_len = strlen(entry) + 1;

    uint8_t *code = (uint8_t *)malloc(src->code_size);
    char *entrypoint = (char *)malloc(entry_len);
    if (!code || !entrypoint) {
        free(code);
        free(entrypoint);
        smud_set_error("gpu specializer: out of memory copying shader blob");
        return false;
    }

    memcpy(code, src->code, src->code_size);
    memcpy(entrypoint, entry, entry_len);

    blob_free(dst);
    dst->code = code;
    dst->code_size = src->code_size;
    dst->entrypoint = entrypoint;
    dst->format = src->format;
    dst->num_uniform_buffers = src->num_uniform_buffers;
    return true;
}

static FragmentEntry *find_fragment(Smud_GpuSpecializer *gs, Smud_ShaderId sdf, Smud_ShaderId fill) {
    for (size_t i = 0; i < gs->fragment_count; i++) {
        FragmentEntry *f = &gs->fragments[i];
        if (smud_shader_id_equals(f->sdf, sdf) && smud_shader_id_equals(f->fill, fill)) {
            return f;
        }
    }
    return NULL;
}

/* ============================================================================
 * Pipeline Creation
 * ============================================================================ */

static SDL_GPUShader *create_shader(SDL_GPUDevice *gpu, const StoredBlob *blob,
                                    SDL_GPUShaderStage stage) {
    SDL_GPUShaderCreateInfo info = {};
    info.code = blob->code;
    info.code_size = blob->code_size;
    info.entrypoint = blob->entrypoint;
    info.format = blob->format;
    info.stage = stage;
    info.num_samplers = 0;
    info.num_storage_textures = 0;
    info.num_storage_buffers = 0;
    info.num_uniform_buffers = blob->num_uniform_buffers;
    return SDL_CreateGPUShader(gpu, &info);
}

static void setup_blend_state(SDL_GPUColorTargetBlendState *blend, Smud_BlendMode mode) {
    memset(blend, 0, sizeof(*blend));
    blend->enable_blend = true;
    blend->color_blend_op = SDL_GPU_BLENDOP_ADD;
    blend->alpha_blend_op = SDL_GPU_BLENDOP_ADD;
    blend->color_write_mask = SDL_GPU_COLORCOMPONENT_R | SDL_GPU_COLORCOMPONENT_G |
                              SDL_GPU_COLORCOMPONENT_B | SDL_GPU_COLORCOMPONENT_A;

    switch (mode) {
        case SMUD_BLEND_ADDITIVE:
            blend->src_color_blendfactor = SDL_GPU_BLENDFACTOR_SRC_ALPHA;
            blend->dst_color_blendfactor = SDL_GPU_BLENDFACTOR_ONE;
            blend->src_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE;
            blend->dst_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE;
            break;
        case SMUD_BLEND_ALPHA:
        default:
            blend->src_color_blendfactor = SDL_GPU_BLENDFACTOR_SRC_ALPHA;
            blend->dst_color_blendfactor = SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA;
            blend->src_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE;
            blend->dst_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA;
            break;
    }
}

static SDL_GPUGraphicsPipeline *build_pipeline(Smud_GpuSpecializer *gs, const Smud_PipelineKey *key) {
    FragmentEntry *fragment = find_fragment(gs, key->sdf, key->fill);
    if (!gs->has_vertex || !fragment) {
        smud_set_error("gpu specializer: shaders for pair %016llx/%016llx were removed",
                       (unsigned long long)key->sdf.value,
                       (unsigned long long)key->fill.value);
        return NULL;
    }

    SDL_GPUShader *vertex_shader = create_shader(gs->gpu, &gs->vertex, SDL_GPU_SHADERSTAGE_VERTEX);
    if (!vertex_shader) {
        smud_set_error_from_sdl("gpu specializer: failed to create vertex shader");
        return NULL;
    }

    SDL_GPUShader *fragment_shader = create_shader(gs->gpu, &fragment->blob, SDL_GPU_SHADERSTAGE_FRAGMENT);
    if (!fragment_shader) {
        smud_set_error_from_sdl("gpu specializer: failed to create fragment shader");
        SDL_ReleaseGPUShader(gs->gpu, vertex_shader);
        return NULL;
    }

    /* Instance-rate attributes, one record per shape */
    SDL_GPUVertexAttribute attributes[] = {
        { .location = 0, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT3,
          .offset = offsetof(Smud_ShapeVertex, position) },
        { .location = 1, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4,
          .offset = offsetof(Smud_ShapeVertex, color) },
        { .location = 2, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4,
          .offset = offsetof(Smud_ShapeVertex, params) },
        { .location = 3, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT2,
          .offset = offsetof(Smud_ShapeVertex, rotation) },
        { .location = 4, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT,
          .offset = offsetof(Smud_ShapeVertex, scale) },
        { .location = 5, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT,
          .offset = offsetof(Smud_ShapeVertex, frame) },
    };

    SDL_GPUVertexBufferDescription vb_desc = {
        .slot = 0,
        .pitch = sizeof(Smud_ShapeVertex),
        .input_rate = SDL_GPU_VERTEXINPUTRATE_INSTANCE,
        .instance_step_rate = 0
    };

    SDL_GPUColorTargetDescription color_target = {};
    color_target.format = key->target_format;
    setup_blend_state(&color_target.blend_state, key->blend_mode);

    SDL_GPUGraphicsPipelineCreateInfo info = {};
    info.vertex_shader = vertex_shader;
    info.fragment_shader = fragment_shader;
    info.vertex_input_state.vertex_buffer_descriptions = &vb_desc;
    info.vertex_input_state.num_vertex_buffers = 1;
    info.vertex_input_state.vertex_attributes = attributes;
    info.vertex_input_state.num_vertex_attributes = SDL_arraysize(attributes);
    info.primitive_type = SDL_GPU_PRIMITIVETYPE_TRIANGLESTRIP;
    info.rasterizer_state.fill_mode = SDL_GPU_FILLMODE_FILL;
    info.rasterizer_state.cull_mode = SDL_GPU_CULLMODE_NONE;
    info.rasterizer_state.front_face = SDL_GPU_FRONTFACE_COUNTER_CLOCKWISE;
    info.multisample_state.sample_count = key->sample_count;
    info.depth_stencil_state.enable_depth_test = false;
    info.depth_stencil_state.enable_depth_write = false;
    info.target_info.color_target_descriptions = &color_target;
    info.target_info.num_color_targets = 1;
    info.target_info.depth_stencil_format = SDL_GPU_TEXTUREFORMAT_INVALID;
    info.target_info.has_depth_stencil_target = false;

    SDL_GPUGraphicsPipeline *pipeline = SDL_CreateGPUGraphicsPipeline(gs->gpu, &info);

    SDL_ReleaseGPUShader(gs->gpu, vertex_shader);
    SDL_ReleaseGPUShader(gs->gpu, fragment_shader);

    if (!pipeline) {
        smud_set_error_from_sdl("gpu specializer: failed to create graphics pipeline");
    }
    return pipeline;
}

/* ============================================================================
 * Specializer Callbacks
 * ============================================================================ */

static Smud_PipelineHandle gs_specialize(void *userdata, const Smud_PipelineKey *key) {
    Smud_GpuSpecializer *gs = (Smud_GpuSpecializer *)userdata;
    Smud_PipelineHandle handle = SMUD_PIPELINE_HANDLE_INVALID;

    /* Shaders not registered yet: let the cache retry next frame */
    if (!gs->has_vertex || !find_fragment(gs, key->sdf, key->fill)) return handle;

    if (gs->slot_count == gs->slot_capacity) {
        size_t new_capacity = gs->slot_capacity ? gs->slot_capacity * 2 : 16;
        PipelineSlot *slots = SMUD_REALLOC(gs->slots, PipelineSlot, new_capacity);
        if (!slots) {
            smud_log_error(SMUD_LOG_RENDER, "gpu specializer: out of memory queueing pipeline");
            return handle;
        }
        gs->slots = slots;
        gs->slot_capacity = new_capacity;
    }

    PipelineSlot *slot = &gs->slots[gs->slot_count++];
    slot->key = *key;
    slot->state = SMUD_PIPELINE_PENDING;
    slot->pipeline = NULL;

    handle.value = (uint32_t)gs->slot_count;
    return handle;
}

static PipelineSlot *slot_for(Smud_GpuSpecializer *gs, Smud_PipelineHandle handle) {
    if (handle.value == 0 || handle.value > gs->slot_count) return NULL;
    return &gs->slots[handle.value - 1];
}

static Smud_PipelineState gs_get_state(void *userdata, Smud_PipelineHandle handle) {
    PipelineSlot *slot = slot_for((Smud_GpuSpecializer *)userdata, handle);
    return slot ? slot->state : SMUD_PIPELINE_INVALID;
}

static SDL_GPUGraphicsPipeline *gs_resolve(void *userdata, Smud_PipelineHandle handle) {
    PipelineSlot *slot = slot_for((Smud_GpuSpecializer *)userdata, handle);
    return (slot && slot->state == SMUD_PIPELINE_READY) ? slot->pipeline : NULL;
}

/* ============================================================================
 * Public API
 * ============================================================================ */

Smud_GpuSpecializer *smud_gpu_specializer_create(SDL_GPUDevice *gpu,
                                                 const Smud_GpuSpecializerConfig *config) {
    Smud_GpuSpecializerConfig defaults = SMUD_GPU_SPECIALIZER_CONFIG_DEFAULT;
    if (!config) config = &defaults;

    if (!gpu && !config->build) {
        smud_set_error("gpu specializer: no GPU device");
        return NULL;
    }

    Smud_GpuSpecializer *gs = SMUD_ALLOC(Smud_GpuSpecializer);
    if (!gs) {
        smud_set_error("gpu specializer: out of memory");
        return NULL;
    }

    gs->gpu = gpu;
    gs->compile_budget = config->compile_budget;
    gs->build = config->build;
    gs->release = config->release;
    gs->build_userdata = config->build_userdata;
    return gs;
}

void smud_gpu_specializer_destroy(Smud_GpuSpecializer *gs) {
    if (!gs) return;

    for (size_t i = 0; i < gs->slot_count; i++) {
        SDL_GPUGraphicsPipeline *pipeline = gs->slots[i].pipeline;
        if (!pipeline) continue;

        if (gs->release) {
            gs->release(gs->build_userdata, pipeline);
        } else if (gs->gpu) {
            SDL_ReleaseGPUGraphicsPipeline(gs->gpu, pipeline);
        }
    }
    free(gs->slots);

    for (size_t i = 0; i < gs->fragment_count; i++) {
        blob_free(&gs->fragments[i].blob);
    }
    free(gs->fragments);

    blob_free(&gs->vertex);
    free(gs);
}

bool smud_gpu_specializer_set_vertex_shader(Smud_GpuSpecializer *gs, const Smud_ShaderBlob *blob) {
    if (!gs) return false;
    if (!blob_copy(&gs->vertex, blob)) return false;

    gs->has_vertex = true;
    return true;
}

bool smud_gpu_specializer_register_fragment(Smud_GpuSpecializer *gs,
                                            Smud_ShaderId sdf, Smud_ShaderId fill,
                                            const Smud_ShaderBlob *blob) {
    if (!gs) return false;

    FragmentEntry *existing = find_fragment(gs, sdf, fill);
    if (existing) {
        /* Pipelines already built keep the old code; the cache is never invalidated */
        return blob_copy(&existing->blob, blob);
    }

    if (gs->fragment_count == gs->fragment_capacity) {
        size_t new_capacity = gs->fragment_capacity ? gs->fragment_capacity * 2 : 8;
        FragmentEntry *fragments = SMUD_REALLOC(gs->fragments, FragmentEntry, new_capacity);
        if (!fragments) {
            smud_set_error("gpu specializer: out of memory registering fragment");
            return false;
        }
        gs->fragments = fragments;
        gs->fragment_capacity = new_capacity;
    }

    FragmentEntry *entry = &gs->fragments[gs->fragment_count];
    memset(entry, 0, sizeof(*entry));
    entry->sdf = sdf;
    entry->fill = fill;
    if (!blob_copy(&entry->blob, blob)) return false;

    gs->fragment_count++;
    return true;
}

int smud_gpu_specializer_process(Smud_GpuSpecializer *gs) {
    if (!gs) return 0;

    int budget = gs->compile_budget;
    int compiled = 0;
    int attempted = 0;

    while (gs->pending_cursor < gs->slot_count) {
        if (budget > 0 && attempted >= budget) break;

        PipelineSlot *slot = &gs->slots[gs->pending_cursor++];
        if (slot->state != SMUD_PIPELINE_PENDING) continue;
        attempted++;

        slot->pipeline = gs->build ? gs->build(gs->build_userdata, &slot->key)
                                   : build_pipeline(gs, &slot->key);
        if (slot->pipeline) {
            slot->state = SMUD_PIPELINE_READY;
            compiled++;
        } else {
            slot->state = SMUD_PIPELINE_FAILED;
            smud_log_and_clear_error(SMUD_LOG_RENDER);
        }
    }

    return compiled;
}

int smud_gpu_specializer_pending_count(const Smud_GpuSpecializer *gs) {
    if (!gs) return 0;

    int pending = 0;
    for (size_t i = gs->pending_cursor; i < gs->slot_count; i++) {
        if (gs->slots[i].state == SMUD_PIPELINE_PENDING) pending++;
    }
    return pending;
}

Smud_PipelineSpecializer smud_gpu_specializer_interface(Smud_GpuSpecializer *gs) {
    Smud_PipelineSpecializer spec;
    spec.specialize = gs_specialize;
    spec.get_state = gs_get_state;
    spec.resolve = gs_resolve;
    spec.userdata = gs;
    return spec;
}
