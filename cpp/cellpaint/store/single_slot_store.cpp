#include "cellpaint/store/single_slot_store.h"

namespace cellpaint {

bool SingleSlotStore::add(const LayerPtr& layer) {
    const Layer& incoming = requireLayer(layer, "SingleSlotStore::add");
    if (sameLayer(current_.get(), &incoming)) return false;
    current_ = layer;
    return true;
}

bool SingleSlotStore::erase(const LayerPtr& /*layer*/) {
    if (!current_) return false;
    current_.reset();
    return true;
}

Color SingleSlotStore::getColor(const Color& base, std::uint32_t timestamp, int x, int y) const {
    const Color color = current_ ? current_->apply(base, timestamp, x, y) : base;
    return inverted_ ? invertColor(color) : color;
}

void SingleSlotStore::special() {
    inverted_ = !inverted_;
}

void SingleSlotStore::clear() {
    current_.reset();
    inverted_ = false;
}

} // namespace cellpaint
