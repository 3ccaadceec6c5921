#pragma once

#include "cellpaint/core/types.h"
#include "cellpaint/layer/layer_registry.h"
#include "cellpaint/store/layer_store.h"
#include <memory>
#include <optional>
#include <string_view>

namespace cellpaint {

// Accepts "set"/"single", "additive", "sequence"/"toggle".
std::optional<StoreKind> parseStoreKind(std::string_view text);
const char* storeKindName(StoreKind kind) noexcept;

// Builds the store a canvas cell was configured with. Throws
// std::invalid_argument for an additive capacity outside
// [1, kMaxAdditiveCapacity] or a toggle-set store without a registry.
std::unique_ptr<LayerStore> createLayerStore(
    const StoreConfig& config,
    std::shared_ptr<const LayerRegistry> registry = nullptr);

} // namespace cellpaint
