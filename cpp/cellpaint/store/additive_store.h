#pragma once

#include "cellpaint/store/bounded_queue.h"
#include "cellpaint/store/layer_store.h"
#include <cstddef>
#include <vector>

namespace cellpaint {

// Each added layer applies after all previous ones.
// - add: append a layer to be applied last; rejected once capacity is reached.
// - erase: remove the oldest layer, whatever layer is passed.
// - special: reverse the order of the current layers.
class AdditiveStore final : public LayerStore {
public:
    // Throws std::invalid_argument if capacity is 0.
    explicit AdditiveStore(std::size_t capacity);

    bool add(const LayerPtr& layer) override;
    bool erase(const LayerPtr& layer) override;
    Color getColor(const Color& base, std::uint32_t timestamp, int x, int y) const override;
    void special() override;
    void clear() override;
    StoreKind kind() const noexcept override { return StoreKind::Additive; }

    // Front (first applied) to back.
    std::vector<LayerPtr> layers() const;
    std::size_t size() const noexcept { return layers_.size(); }
    std::size_t capacity() const noexcept { return layers_.capacity(); }
    bool isFull() const noexcept { return layers_.isFull(); }

private:
    BoundedQueue<LayerPtr> layers_;
};

} // namespace cellpaint
