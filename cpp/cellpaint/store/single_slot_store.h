#pragma once

#include "cellpaint/store/layer_store.h"

namespace cellpaint {

// Holds a single layer (or nothing).
// - add: set the single layer.
// - erase: remove the single layer, whatever layer is passed.
// - special: invert the colour output.
class SingleSlotStore final : public LayerStore {
public:
    bool add(const LayerPtr& layer) override;
    bool erase(const LayerPtr& layer) override;
    Color getColor(const Color& base, std::uint32_t timestamp, int x, int y) const override;
    void special() override;
    void clear() override;
    StoreKind kind() const noexcept override { return StoreKind::SingleSlot; }

    const LayerPtr& current() const noexcept { return current_; }
    bool isInverted() const noexcept { return inverted_; }

private:
    LayerPtr current_;
    bool inverted_ = false;
};

} // namespace cellpaint
