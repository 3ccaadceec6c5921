#include "cellpaint/command/command_dispatch.h"
#include "cellpaint/command/commands.h"
#include "cellpaint/core/logging.h"

#include <stdexcept>
#include <string>

namespace cellpaint {

namespace {

struct DispatchContext {
    LayerStore* store;
    const LayerRegistry* registry;
    CommandBufferResult* result;
};

StoreError changedOrRejected(bool changed) {
    return changed ? StoreError::Ok : StoreError::Rejected;
}

} // namespace

StoreError dispatchCommand(
    LayerStore& store,
    const LayerRegistry& registry,
    std::uint32_t op,
    std::string_view layerName
) {
    switch (op) {
        case static_cast<std::uint32_t>(CommandOp::Add): {
            const LayerPtr layer = registry.find(layerName);
            if (!layer) {
                CELLPAINT_LOG_WARN("add: unknown layer '%s'", std::string(layerName).c_str());
                return StoreError::UnknownLayer;
            }
            try {
                return changedOrRejected(store.add(layer));
            } catch (const std::invalid_argument& e) {
                // Toggle-set stores resolve names through their own registry.
                CELLPAINT_LOG_WARN("add: %s", e.what());
                return StoreError::UnknownLayer;
            }
        }
        case static_cast<std::uint32_t>(CommandOp::Erase): {
            LayerPtr layer;
            if (!layerName.empty()) {
                layer = registry.find(layerName);
                if (!layer) {
                    CELLPAINT_LOG_WARN("erase: unknown layer '%s'", std::string(layerName).c_str());
                    return StoreError::UnknownLayer;
                }
            } else if (store.kind() == StoreKind::ToggleSet) {
                return StoreError::UnknownLayer;
            }
            return changedOrRejected(store.erase(layer));
        }
        case static_cast<std::uint32_t>(CommandOp::Special):
            store.special();
            return StoreError::Ok;
        default:
            CELLPAINT_LOG_WARN("unknown command op %u", op);
            return StoreError::UnknownCommand;
    }
}

CommandBufferResult applyCommandBuffer(
    LayerStore& store,
    const LayerRegistry& registry,
    const std::uint8_t* src,
    std::uint32_t byteCount
) {
    CommandBufferResult result;
    DispatchContext ctx{ &store, &registry, &result };

    auto commandCallback = [](void* raw, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount) -> StoreError {
        auto* c = reinterpret_cast<DispatchContext*>(raw);
        const std::string_view name(reinterpret_cast<const char*>(payload), payloadByteCount);
        const StoreError err = dispatchCommand(*c->store, *c->registry, op, name);
        if (err == StoreError::Ok) {
            c->result->changed++;
            return StoreError::Ok;
        }
        if (err == StoreError::Rejected) {
            c->result->rejected++;
            return StoreError::Ok;
        }
        return err;
    };

    result.error = parseCommandBuffer(src, byteCount, commandCallback, &ctx);
    return result;
}

} // namespace cellpaint
