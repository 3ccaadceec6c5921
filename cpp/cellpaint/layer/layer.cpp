#include "cellpaint/layer/layer.h"

#include <stdexcept>
#include <utility>

namespace cellpaint {

Layer::Layer(std::string name) : name_(std::move(name)) {
    if (name_.empty()) {
        throw std::invalid_argument("Layer name must not be empty");
    }
}

bool sameLayer(const Layer* a, const Layer* b) noexcept {
    if (a == b) return true;
    if (!a || !b) return false;
    return a->name() == b->name();
}

FunctionLayer::FunctionLayer(std::string name, Transform transform)
    : Layer(std::move(name)), transform_(std::move(transform)) {
    if (!transform_) {
        throw std::invalid_argument("FunctionLayer requires a transform");
    }
}

Color FunctionLayer::apply(const Color& color, std::uint32_t timestamp, int x, int y) const {
    return transform_(color, timestamp, x, y);
}

LayerPtr makeLayer(std::string name, FunctionLayer::Transform transform) {
    return std::make_shared<FunctionLayer>(std::move(name), std::move(transform));
}

const Layer& requireLayer(const LayerPtr& layer, const char* operation) {
    if (!layer) {
        throw std::invalid_argument(std::string(operation) + ": layer must not be null");
    }
    return *layer;
}

} // namespace cellpaint
