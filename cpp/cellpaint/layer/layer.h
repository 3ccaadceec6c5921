#pragma once

#include "cellpaint/core/types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cellpaint {

// A named color effect. Layers are immutable and shared between cells,
// so stores refer to them through LayerPtr. Two layers with the same
// name are the same layer as far as every store is concerned.
class Layer {
public:
    explicit Layer(std::string name);
    virtual ~Layer() = default;

    Layer(const Layer&) = delete;
    Layer& operator=(const Layer&) = delete;

    const std::string& name() const noexcept { return name_; }

    // Transforms the running color of cell (x, y) at `timestamp`.
    virtual Color apply(const Color& color, std::uint32_t timestamp, int x, int y) const = 0;

private:
    std::string name_;
};

using LayerPtr = std::shared_ptr<const Layer>;

bool sameLayer(const Layer* a, const Layer* b) noexcept;

// Layer backed by an arbitrary transform.
class FunctionLayer final : public Layer {
public:
    using Transform = std::function<Color(const Color&, std::uint32_t, int, int)>;

    FunctionLayer(std::string name, Transform transform);

    Color apply(const Color& color, std::uint32_t timestamp, int x, int y) const override;

private:
    Transform transform_;
};

LayerPtr makeLayer(std::string name, FunctionLayer::Transform transform);

// Throws std::invalid_argument for a null layer.
const Layer& requireLayer(const LayerPtr& layer, const char* operation);

} // namespace cellpaint
