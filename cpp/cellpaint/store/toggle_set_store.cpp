#include "cellpaint/store/toggle_set_store.h"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace cellpaint {

ToggleSetStore::ToggleSetStore(std::shared_ptr<const LayerRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("ToggleSetStore requires a layer registry");
    }
}

bool ToggleSetStore::add(const LayerPtr& layer) {
    const Layer& incoming = requireLayer(layer, "ToggleSetStore::add");
    if (!registry_->contains(incoming.name())) {
        throw std::invalid_argument("ToggleSetStore::add: layer '" + incoming.name() + "' is not registered");
    }
    return applied_.insert(incoming.name()).second;
}

bool ToggleSetStore::erase(const LayerPtr& layer) {
    const Layer& target = requireLayer(layer, "ToggleSetStore::erase");
    return applied_.erase(target.name()) > 0;
}

Color ToggleSetStore::getColor(const Color& base, std::uint32_t timestamp, int x, int y) const {
    Color color = base;
    // std::set iterates in ascending name order.
    for (const std::string& name : applied_) {
        const LayerPtr layer = registry_->find(name);
        if (!layer) continue;
        color = layer->apply(color, timestamp, x, y);
    }
    return color;
}

void ToggleSetStore::special() {
    if (applied_.empty()) return;
    // Lower middle on a tie, i.e. the lexicographically smaller median.
    auto median = applied_.begin();
    std::advance(median, static_cast<std::ptrdiff_t>((applied_.size() - 1) / 2));
    applied_.erase(median);
}

void ToggleSetStore::clear() {
    applied_.clear();
}

std::vector<std::string> ToggleSetStore::appliedNames() const {
    return std::vector<std::string>(applied_.begin(), applied_.end());
}

bool ToggleSetStore::contains(std::string_view name) const {
    return applied_.find(name) != applied_.end();
}

} // namespace cellpaint
