#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the public store API for bindings.
#include "cellpaint/command/command_dispatch.h"
#include "cellpaint/layer/layer_registry.h"
#include "cellpaint/store/store_factory.h"

#ifdef EMSCRIPTEN
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

using namespace cellpaint;

std::uint32_t packRgb(const Color& c) {
    return (static_cast<std::uint32_t>(c.r) << 16) | (static_cast<std::uint32_t>(c.g) << 8) | c.b;
}

// Registry whose layers call back into JavaScript:
// fn(r, g, b, timestamp, x, y) -> [r, g, b]
class JsLayerRegistry {
public:
    JsLayerRegistry() : registry_(std::make_shared<LayerRegistry>()) {}

    bool registerLayer(const std::string& name, emscripten::val fn) {
        auto layer = makeLayer(name, [fn](const Color& color, std::uint32_t timestamp, int x, int y) {
            const emscripten::val out = fn(color.r, color.g, color.b, timestamp, x, y);
            return Color{
                clampChannel(out[0].as<int>()),
                clampChannel(out[1].as<int>()),
                clampChannel(out[2].as<int>()),
            };
        });
        return registry_->registerLayer(std::move(layer));
    }

    bool contains(const std::string& name) const { return registry_->contains(name); }
    std::uint32_t size() const { return static_cast<std::uint32_t>(registry_->size()); }

    const std::shared_ptr<LayerRegistry>& registry() const { return registry_; }

private:
    std::shared_ptr<LayerRegistry> registry_;
};

class JsLayerStore {
public:
    JsLayerStore(const std::string& kindName, std::uint32_t capacity, const JsLayerRegistry& registry)
        : registry_(registry.registry()) {
        const auto kind = parseStoreKind(kindName);
        if (!kind) {
            throw std::invalid_argument("Unknown store kind: " + kindName);
        }
        StoreConfig config;
        config.kind = *kind;
        config.capacity = capacity;
        store_ = createLayerStore(config, registry_);
    }

    std::uint32_t add(const std::string& name) {
        return static_cast<std::uint32_t>(dispatchCommand(*store_, *registry_, static_cast<std::uint32_t>(CommandOp::Add), name));
    }

    std::uint32_t erase(const std::string& name) {
        return static_cast<std::uint32_t>(dispatchCommand(*store_, *registry_, static_cast<std::uint32_t>(CommandOp::Erase), name));
    }

    void special() { store_->special(); }
    void clear() { store_->clear(); }

    std::uint32_t getColor(std::uint32_t r, std::uint32_t g, std::uint32_t b, std::uint32_t timestamp, int x, int y) const {
        const Color base{
            clampChannel(static_cast<int>(r)),
            clampChannel(static_cast<int>(g)),
            clampChannel(static_cast<int>(b)),
        };
        return packRgb(store_->getColor(base, timestamp, x, y));
    }

    CommandBufferResult applyCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount) {
        const std::uint8_t* src = reinterpret_cast<const std::uint8_t*>(ptr);
        return cellpaint::applyCommandBuffer(*store_, *registry_, src, byteCount);
    }

    std::string kind() const { return storeKindName(store_->kind()); }

private:
    std::shared_ptr<LayerRegistry> registry_;
    std::unique_ptr<LayerStore> store_;
};

std::uint32_t commandBufferError(const CommandBufferResult& r) { return static_cast<std::uint32_t>(r.error); }
void setCommandBufferError(CommandBufferResult& r, std::uint32_t v) { r.error = static_cast<StoreError>(v); }

} // namespace

EMSCRIPTEN_BINDINGS(cellpaint_module) {
    emscripten::value_object<CommandBufferResult>("CommandBufferResult")
        .field("error", &commandBufferError, &setCommandBufferError)
        .field("changed", &CommandBufferResult::changed)
        .field("rejected", &CommandBufferResult::rejected);

    emscripten::class_<JsLayerRegistry>("LayerRegistry")
        .constructor<>()
        .function("registerLayer", &JsLayerRegistry::registerLayer)
        .function("contains", &JsLayerRegistry::contains)
        .function("size", &JsLayerRegistry::size);

    emscripten::class_<JsLayerStore>("LayerStore")
        .constructor<std::string, std::uint32_t, const JsLayerRegistry&>()
        .function("add", &JsLayerStore::add)
        .function("erase", &JsLayerStore::erase)
        .function("special", &JsLayerStore::special)
        .function("clear", &JsLayerStore::clear)
        .function("getColor", &JsLayerStore::getColor)
        .function("applyCommandBuffer", &JsLayerStore::applyCommandBuffer)
        .function("kind", &JsLayerStore::kind);
}
#endif
