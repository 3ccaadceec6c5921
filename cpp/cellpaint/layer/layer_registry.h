#pragma once

#include "cellpaint/layer/layer.h"
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cellpaint {

// Name -> layer lookup shared by the stores that keep only layer names.
class LayerRegistry {
public:
    // Returns false if a layer with the same name is already registered.
    // Throws std::invalid_argument for a null layer.
    bool registerLayer(LayerPtr layer);

    LayerPtr find(std::string_view name) const;
    bool contains(std::string_view name) const;

    // Sorted ascending.
    std::vector<std::string> names() const;
    std::size_t size() const noexcept { return layers_.size(); }
    bool empty() const noexcept { return layers_.empty(); }

private:
    std::map<std::string, LayerPtr, std::less<>> layers_;
};

} // namespace cellpaint
