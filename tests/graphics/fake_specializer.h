/*
 * Smud - In-memory pipeline specializer for tests
 *
 * Hands out sequential handles and lets a test decide, per key or
 * globally, whether pipelines come back ready, pending or not at all.
 */

#ifndef SMUD_TESTS_FAKE_SPECIALIZER_H
#define SMUD_TESTS_FAKE_SPECIALIZER_H

#include "smud/pipeline.h"
#include <vector>

struct FakeSpecializer {
    struct Entry {
        Smud_PipelineKey key;
        Smud_PipelineState state;
    };

    std::vector<Entry> entries;
    int specialize_calls = 0;

    /* State given to new handles */
    Smud_PipelineState initial_state = SMUD_PIPELINE_READY;

    /* When set, specialize refuses this sdf */
    bool refuse_sdf = false;
    Smud_ShaderId refused_sdf = SMUD_SHADER_ID_NONE;

    static Smud_PipelineHandle specialize(void *userdata, const Smud_PipelineKey *key) {
        FakeSpecializer *self = static_cast<FakeSpecializer *>(userdata);
        self->specialize_calls++;

        Smud_PipelineHandle handle = SMUD_PIPELINE_HANDLE_INVALID;
        if (self->refuse_sdf && smud_shader_id_equals(key->sdf, self->refused_sdf)) {
            return handle;
        }

        self->entries.push_back({ *key, self->initial_state });
        handle.value = (uint32_t)self->entries.size();
        return handle;
    }

    static Smud_PipelineState get_state(void *userdata, Smud_PipelineHandle handle) {
        FakeSpecializer *self = static_cast<FakeSpecializer *>(userdata);
        if (handle.value == 0 || handle.value > self->entries.size()) return SMUD_PIPELINE_INVALID;
        return self->entries[handle.value - 1].state;
    }

    /* Mark every pending pipeline ready */
    void finish_all() {
        for (Entry &e : entries) {
            if (e.state == SMUD_PIPELINE_PENDING) e.state = SMUD_PIPELINE_READY;
        }
    }

    void set_state(Smud_PipelineHandle handle, Smud_PipelineState state) {
        if (handle.value > 0 && handle.value <= entries.size()) {
            entries[handle.value - 1].state = state;
        }
    }

    Smud_PipelineSpecializer interface() {
        Smud_PipelineSpecializer spec = {};
        spec.specialize = specialize;
        spec.get_state = get_state;
        spec.resolve = nullptr;
        spec.userdata = this;
        return spec;
    }
};

inline Smud_PipelineKey make_pipeline_key(uint64_t sdf, uint64_t fill,
                                          Smud_BlendMode blend = SMUD_BLEND_ALPHA) {
    Smud_PipelineKey key = {};
    key.sdf.value = sdf;
    key.fill.value = fill;
    key.blend_mode = blend;
    key.target_format = SDL_GPU_TEXTUREFORMAT_B8G8R8A8_UNORM;
    key.sample_count = SDL_GPU_SAMPLECOUNT_1;
    return key;
}

#endif /* SMUD_TESTS_FAKE_SPECIALIZER_H */
