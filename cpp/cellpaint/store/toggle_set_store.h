#pragma once

#include "cellpaint/layer/layer_registry.h"
#include "cellpaint/store/layer_store.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cellpaint {

// Each layer type is either applied or not, and applied layers run in
// ascending name order. Only names are kept; layers are resolved through
// the registry when compositing.
// - add: ensure the layer type is applied.
// - erase: ensure the layer type is not applied.
// - special: remove the applied layer with the median name (the lower of
//   the two middle names when the count is even).
class ToggleSetStore final : public LayerStore {
public:
    // Throws std::invalid_argument for a null registry.
    explicit ToggleSetStore(std::shared_ptr<const LayerRegistry> registry);

    // Throws std::invalid_argument if the layer name is not registered.
    bool add(const LayerPtr& layer) override;
    bool erase(const LayerPtr& layer) override;
    Color getColor(const Color& base, std::uint32_t timestamp, int x, int y) const override;
    void special() override;
    void clear() override;
    StoreKind kind() const noexcept override { return StoreKind::ToggleSet; }

    // Sorted ascending.
    std::vector<std::string> appliedNames() const;
    bool contains(std::string_view name) const;
    std::size_t size() const noexcept { return applied_.size(); }

private:
    std::shared_ptr<const LayerRegistry> registry_;
    std::set<std::string, std::less<>> applied_;
};

} // namespace cellpaint
