#include "cellpaint/layer/layer_registry.h"
#include "cellpaint/core/logging.h"

#include <utility>

namespace cellpaint {

bool LayerRegistry::registerLayer(LayerPtr layer) {
    const Layer& checked = requireLayer(layer, "LayerRegistry::registerLayer");
    auto it = layers_.find(checked.name());
    if (it != layers_.end()) {
        CELLPAINT_LOG_WARN("layer '%s' is already registered", checked.name().c_str());
        return false;
    }
    layers_.emplace(checked.name(), std::move(layer));
    return true;
}

LayerPtr LayerRegistry::find(std::string_view name) const {
    const auto it = layers_.find(name);
    if (it == layers_.end()) return nullptr;
    return it->second;
}

bool LayerRegistry::contains(std::string_view name) const {
    return layers_.find(name) != layers_.end();
}

std::vector<std::string> LayerRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(layers_.size());
    for (const auto& kv : layers_) out.push_back(kv.first);
    return out;
}

} // namespace cellpaint
