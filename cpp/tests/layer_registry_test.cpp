#include <gtest/gtest.h>
#include "cellpaint/layer/layer_registry.h"
#include "tests/test_layers.h"
#include <stdexcept>
#include <string>
#include <vector>

using namespace cellpaint;
using namespace cellpaint_test;

TEST(LayerRegistryTest, RegisterAndFind) {
    LayerRegistry registry;
    EXPECT_TRUE(registry.empty());

    const LayerPtr red = makeSolid("red", Color{ 255, 0, 0 });
    EXPECT_TRUE(registry.registerLayer(red));
    EXPECT_TRUE(registry.contains("red"));
    EXPECT_EQ(registry.find("red"), red);
    EXPECT_EQ(registry.find("green"), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(LayerRegistryTest, DuplicateNameKeepsFirstLayer) {
    LayerRegistry registry;
    const LayerPtr first = makeSolid("red", Color{ 255, 0, 0 });
    const LayerPtr second = makeSolid("red", Color{ 200, 0, 0 });

    EXPECT_TRUE(registry.registerLayer(first));
    EXPECT_FALSE(registry.registerLayer(second));
    EXPECT_EQ(registry.find("red"), first);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(LayerRegistryTest, NamesAreSorted) {
    LayerRegistry registry;
    registry.registerLayer(makeSolid("sparkle", Color{ 1, 1, 1 }));
    registry.registerLayer(makeSolid("black", Color{ 0, 0, 0 }));
    registry.registerLayer(makeSolid("lighten", Color{ 2, 2, 2 }));

    const std::vector<std::string> expected{ "black", "lighten", "sparkle" };
    EXPECT_EQ(registry.names(), expected);
}

TEST(LayerRegistryTest, NullLayerIsRejected) {
    LayerRegistry registry;
    EXPECT_THROW(registry.registerLayer(nullptr), std::invalid_argument);
    EXPECT_TRUE(registry.empty());
}
