#pragma once

#include "cellpaint/core/types.h"
#include "cellpaint/layer/layer_registry.h"
#include "cellpaint/store/layer_store.h"
#include <cstdint>
#include <string_view>

namespace cellpaint {

/**
 * Applies one edit to a store. `layerName` is resolved through `registry`.
 * Returns Ok if the store changed, Rejected if the edit was valid but left
 * the store unchanged, UnknownCommand / UnknownLayer otherwise.
 * Erase on single-slot and additive stores ignores the layer, so an empty
 * name is accepted there.
 */
StoreError dispatchCommand(
    LayerStore& store,
    const LayerRegistry& registry,
    std::uint32_t op,
    std::string_view layerName
);

struct CommandBufferResult {
    StoreError error = StoreError::Ok;
    std::uint32_t changed = 0;
    std::uint32_t rejected = 0;
};

// Parses `src` and dispatches every command to `store`. Rejected edits do
// not stop the batch; any other error does.
CommandBufferResult applyCommandBuffer(
    LayerStore& store,
    const LayerRegistry& registry,
    const std::uint8_t* src,
    std::uint32_t byteCount
);

} // namespace cellpaint
