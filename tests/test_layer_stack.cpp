/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layers/cube_halo_padder.hpp"
#include "layers/cube_sphere_conv2d.hpp"
#include "layers/layer_stack.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <torch/torch.h>

using namespace csn;
using namespace csn::layers;

class LayerStackTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_path_ = std::filesystem::temp_directory_path() /
                     ("csn_stack_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                      ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
    }

    // pad(1) -> conv 3x3 valid (filters) -> pad(1) -> conv 3x3 valid (filters), relu
    static LayerStack make_stack(int64_t filters) {
        LayerStack stack;
        for (int i = 0; i < 2; ++i) {
            auto padder = CubeHaloPadder::create({.padding = 1, .name = "pad_" + std::to_string(i)});
            EXPECT_TRUE(padder.has_value());
            stack.add(std::make_unique<CubeHaloPadder>(std::move(*padder)));

            config::ConvConfig config;
            config.name = "conv_" + std::to_string(i);
            config.filters = filters;
            config.kernel_size = {3, 3};
            config.activation = config::Activation::Relu;
            auto conv = CubeSphereConv2D::create(config);
            EXPECT_TRUE(conv.has_value());
            stack.add(std::make_unique<CubeSphereConv2D>(std::move(*conv)));
        }
        return stack;
    }

    std::filesystem::path temp_path_;
};

TEST_F(LayerStackTest, ChainedShapeInference) {
    auto stack = make_stack(4);
    ASSERT_EQ(stack.size(), 4u);

    auto shape = stack.compute_output_shape({std::nullopt, 2, 8, 8, 6});
    ASSERT_TRUE(shape.has_value()) << shape.error();
    EXPECT_EQ(*shape, (core::Shape{std::nullopt, 4, 8, 8, 6}));
}

TEST_F(LayerStackTest, ShapeErrorNamesTheFailingLayer) {
    LayerStack stack;
    auto padder = CubeHaloPadder::create({.padding = 1});
    ASSERT_TRUE(padder.has_value());
    stack.add(std::make_unique<CubeHaloPadder>(std::move(*padder)));

    config::ConvConfig config;
    config.filters = 2;
    config.kernel_size = {5, 5};
    auto conv = CubeSphereConv2D::create(config);
    ASSERT_TRUE(conv.has_value());
    stack.add(std::make_unique<CubeSphereConv2D>(std::move(*conv)));

    auto shape = stack.compute_output_shape({std::nullopt, 1, 2, 2, 6});
    ASSERT_FALSE(shape.has_value());
    EXPECT_NE(shape.error().find("layer 1"), std::string::npos) << shape.error();
    EXPECT_NE(shape.error().find("CubeSphereConv2D"), std::string::npos) << shape.error();
}

TEST_F(LayerStackTest, ForwardMatchesShapeInference) {
    auto stack = make_stack(3);
    auto x = torch::randn({2, 2, 6, 6, 6});

    auto out = stack.forward(x);
    ASSERT_TRUE(out.has_value()) << out.error();
    auto shape = stack.compute_output_shape(core::shape_of(x));
    ASSERT_TRUE(shape.has_value()) << shape.error();
    EXPECT_EQ(core::shape_of(*out), *shape);
    EXPECT_GE(out->min().item<float>(), 0.0f);

    auto bad = stack.forward(torch::randn({2, 2, 6, 5, 6}));
    ASSERT_FALSE(bad.has_value());
    EXPECT_NE(bad.error().find("layer 0"), std::string::npos) << bad.error();
}

TEST_F(LayerStackTest, NamedParametersArePrefixed) {
    auto stack = make_stack(3);
    EXPECT_TRUE(stack.named_parameters().empty());

    ASSERT_TRUE(stack.forward(torch::randn({1, 2, 4, 4, 6})).has_value());
    const auto params = stack.named_parameters();
    ASSERT_EQ(params.size(), 8u);
    EXPECT_EQ(params[0].first, "layer1.equatorial_kernel");
    EXPECT_EQ(params[3].first, "layer1.polar_bias");
    EXPECT_EQ(params[4].first, "layer3.equatorial_kernel");
    EXPECT_EQ(params[4].second.sizes(), (std::vector<int64_t>{3, 3, 3, 3}));
    EXPECT_EQ(stack.parameters().size(), 8u);
}

TEST_F(LayerStackTest, RegularizationAcrossLayers) {
    LayerStack stack;
    for (int i = 0; i < 2; ++i) {
        config::ConvConfig config;
        config.filters = 2;
        config.kernel_size = {1, 1};
        config.kernel_initializer = {.kind = config::InitializerSpec::Kind::Constant, .value = 1.0};
        config.kernel_regularizer = config::RegularizerSpec{.l1 = 0.1, .l2 = 0.0};
        auto conv = CubeSphereConv2D::create(config);
        ASSERT_TRUE(conv.has_value());
        stack.add(std::make_unique<CubeSphereConv2D>(std::move(*conv)));
    }
    ASSERT_TRUE(stack.forward(torch::randn({1, 2, 3, 3, 6})).has_value());

    // Two layers, two groups each, four ones per kernel
    EXPECT_NEAR(stack.regularization_loss().item<double>(), 2 * 2 * 4 * 0.1, 1e-5);
}

TEST_F(LayerStackTest, JsonRoundTrip) {
    auto stack = make_stack(5);
    const auto j = stack.to_json();
    EXPECT_EQ(j["version"], STACK_JSON_VERSION);
    ASSERT_EQ(j["layers"].size(), 4u);
    EXPECT_EQ(j["layers"][0]["class_name"], "CubeSpherePadding2D");
    EXPECT_EQ(j["layers"][1]["class_name"], "CubeSphereConv2D");
    EXPECT_EQ(j["layers"][3]["config"]["name"], "conv_1");

    auto rebuilt = LayerStack::from_json(j);
    ASSERT_TRUE(rebuilt.has_value()) << rebuilt.error();
    EXPECT_EQ(rebuilt->to_json(), j);
}

TEST_F(LayerStackTest, FromJsonErrors) {
    EXPECT_FALSE(LayerStack::from_json(nlohmann::json::object()).has_value());

    nlohmann::json unknown = {{"version", 1},
                              {"layers", {{{"class_name", "DepthwiseConv2D"}, {"config", nlohmann::json::object()}}}}};
    auto err = LayerStack::from_json(unknown);
    ASSERT_FALSE(err.has_value());
    EXPECT_NE(err.error().find("DepthwiseConv2D"), std::string::npos) << err.error();

    nlohmann::json future = {{"version", STACK_JSON_VERSION + 1}, {"layers", nlohmann::json::array()}};
    EXPECT_FALSE(LayerStack::from_json(future).has_value());

    EXPECT_FALSE(layer_from_json({{"class_name", "CubeSphereConv2D"}, {"config", {{"filters", 2}}}}).has_value());
}

TEST_F(LayerStackTest, SaveAndLoadFile) {
    auto stack = make_stack(2);
    ASSERT_TRUE(stack.save_to_json(temp_path_.string()));
    ASSERT_TRUE(std::filesystem::exists(temp_path_));

    LayerStack loaded;
    ASSERT_TRUE(loaded.load_from_json(temp_path_.string()));
    EXPECT_EQ(loaded.size(), 4u);
    EXPECT_EQ(loaded.to_json(), stack.to_json());
    EXPECT_EQ(loaded.at(1).class_name(), "CubeSphereConv2D");

    auto out = loaded.forward(torch::randn({1, 3, 5, 5, 6}));
    ASSERT_TRUE(out.has_value()) << out.error();
    EXPECT_EQ(out->sizes(), (std::vector<int64_t>{1, 2, 5, 5, 6}));
}

TEST_F(LayerStackTest, LoadFailuresKeepExistingLayers) {
    auto stack = make_stack(2);
    EXPECT_FALSE(stack.load_from_json((temp_path_.parent_path() / "csn_does_not_exist.json").string()));
    EXPECT_EQ(stack.size(), 4u);

    {
        std::ofstream file(temp_path_);
        file << "{ not json";
    }
    EXPECT_FALSE(stack.load_from_json(temp_path_.string()));
    EXPECT_EQ(stack.size(), 4u);
}
