#include "cellpaint/store/store_factory.h"
#include "cellpaint/store/additive_store.h"
#include "cellpaint/store/single_slot_store.h"
#include "cellpaint/store/toggle_set_store.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace cellpaint {

std::optional<StoreKind> parseStoreKind(std::string_view text) {
    if (text == "set" || text == "single") return StoreKind::SingleSlot;
    if (text == "additive") return StoreKind::Additive;
    if (text == "sequence" || text == "toggle") return StoreKind::ToggleSet;
    return std::nullopt;
}

const char* storeKindName(StoreKind kind) noexcept {
    switch (kind) {
        case StoreKind::SingleSlot: return "single";
        case StoreKind::Additive: return "additive";
        case StoreKind::ToggleSet: return "toggle";
        default: return "unknown";
    }
}

std::unique_ptr<LayerStore> createLayerStore(
    const StoreConfig& config,
    std::shared_ptr<const LayerRegistry> registry
) {
    switch (config.kind) {
        case StoreKind::SingleSlot:
            return std::make_unique<SingleSlotStore>();
        case StoreKind::Additive:
            if (config.capacity == 0 || config.capacity > kMaxAdditiveCapacity) {
                throw std::invalid_argument(
                    "Additive store capacity must be in [1, " + std::to_string(kMaxAdditiveCapacity) + "]");
            }
            return std::make_unique<AdditiveStore>(config.capacity);
        case StoreKind::ToggleSet:
            return std::make_unique<ToggleSetStore>(std::move(registry));
    }
    throw std::invalid_argument("Unknown store kind");
}

} // namespace cellpaint
