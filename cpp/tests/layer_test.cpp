#include <gtest/gtest.h>
#include "cellpaint/layer/layer.h"
#include "tests/test_layers.h"
#include <stdexcept>

using namespace cellpaint;
using namespace cellpaint_test;

TEST(LayerTest, FunctionLayerAppliesTransform) {
    const LayerPtr layer = makeBrighten("lighten", 40);
    EXPECT_EQ(layer->name(), "lighten");

    const Color out = layer->apply(kBase, kTimestamp, 0, 0);
    EXPECT_EQ(out, (Color{ 50, 60, 70 }));
}

TEST(LayerTest, TransformReceivesTimestampAndPosition) {
    const LayerPtr layer = makeSparkle("sparkle");
    const Color out = layer->apply(Color{ 0, 0, 0 }, 3, 4, 5);
    EXPECT_EQ(out, (Color{ 3, 4, 5 }));
}

TEST(LayerTest, EmptyNameIsRejected) {
    EXPECT_THROW(makeSolid("", Color{ 1, 2, 3 }), std::invalid_argument);
}

TEST(LayerTest, MissingTransformIsRejected) {
    EXPECT_THROW(makeLayer("none", FunctionLayer::Transform{}), std::invalid_argument);
}

TEST(LayerTest, IdentityIsTheName) {
    const LayerPtr a = makeSolid("red", Color{ 255, 0, 0 });
    const LayerPtr b = makeSolid("red", Color{ 0, 0, 255 });
    const LayerPtr c = makeSolid("blue", Color{ 0, 0, 255 });

    EXPECT_TRUE(sameLayer(a.get(), a.get()));
    EXPECT_TRUE(sameLayer(a.get(), b.get()));
    EXPECT_FALSE(sameLayer(a.get(), c.get()));
    EXPECT_FALSE(sameLayer(a.get(), nullptr));
    EXPECT_TRUE(sameLayer(nullptr, nullptr));
}

TEST(LayerTest, RequireLayerRejectsNull) {
    EXPECT_THROW(requireLayer(nullptr, "test"), std::invalid_argument);
    const LayerPtr layer = makeSolid("black", Color{ 0, 0, 0 });
    EXPECT_EQ(&requireLayer(layer, "test"), layer.get());
}

TEST(ColorTest, InvertAndClamp) {
    EXPECT_EQ(invertColor(Color{ 0, 128, 255 }), (Color{ 255, 127, 0 }));
    EXPECT_EQ(invertColor(invertColor(kBase)), kBase);
    EXPECT_EQ(clampChannel(-5), 0);
    EXPECT_EQ(clampChannel(300), 255);
    EXPECT_EQ(clampChannel(42), 42);
}
