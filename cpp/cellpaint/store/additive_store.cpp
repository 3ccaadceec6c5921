#include "cellpaint/store/additive_store.h"
#include "cellpaint/core/logging.h"

namespace cellpaint {

AdditiveStore::AdditiveStore(std::size_t capacity) : layers_(capacity) {}

bool AdditiveStore::add(const LayerPtr& layer) {
    requireLayer(layer, "AdditiveStore::add");
    if (layers_.isFull()) {
        CELLPAINT_LOG_DEBUG("additive store full (%zu), rejected '%s'", layers_.capacity(), layer->name().c_str());
        return false;
    }
    layers_.append(layer);
    return true;
}

bool AdditiveStore::erase(const LayerPtr& /*layer*/) {
    if (layers_.isEmpty()) return false;
    layers_.popFront();
    return true;
}

Color AdditiveStore::getColor(const Color& base, std::uint32_t timestamp, int x, int y) const {
    Color color = base;
    for (const LayerPtr& layer : layers_) {
        color = layer->apply(color, timestamp, x, y);
    }
    return color;
}

void AdditiveStore::special() {
    layers_.reverse();
}

void AdditiveStore::clear() {
    layers_.clear();
}

std::vector<LayerPtr> AdditiveStore::layers() const {
    return std::vector<LayerPtr>(layers_.begin(), layers_.end());
}

} // namespace cellpaint
