#pragma once

#include "cellpaint/core/types.h"
#include "cellpaint/layer/layer.h"
#include <cstdint>

namespace cellpaint {

// Per-cell accumulation of layers. One instance per canvas cell, accessed
// from one thread at a time; getColor() never mutates state.
class LayerStore {
public:
    virtual ~LayerStore() = default;

    // Returns true if the store actually changed.
    virtual bool add(const LayerPtr& layer) = 0;

    // Completes an erase action with `layer`. Returns true if the store
    // actually changed.
    virtual bool erase(const LayerPtr& layer) = 0;

    // Colour this cell shows given the current layers.
    virtual Color getColor(const Color& base, std::uint32_t timestamp, int x, int y) const = 0;

    // Store-specific transformation triggered by the special-mode action.
    virtual void special() = 0;

    // Back to the freshly constructed state.
    virtual void clear() = 0;

    virtual StoreKind kind() const noexcept = 0;
};

} // namespace cellpaint
