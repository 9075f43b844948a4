/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/cube_shape.hpp"
#include "layers/activations.hpp"
#include <gtest/gtest.h>
#include <torch/torch.h>

using namespace csn;

class CubeShapeTest : public ::testing::Test {};

TEST_F(CubeShapeTest, StackAndUnstackFaces) {
    std::vector<torch::Tensor> faces;
    for (int f = 0; f < 6; ++f) {
        faces.push_back(torch::full({2, 3, 4, 4}, static_cast<float>(f)));
    }
    auto cube = core::stack_faces(faces);
    ASSERT_TRUE(cube.has_value()) << cube.error();
    EXPECT_EQ(cube->sizes(), (std::vector<int64_t>{2, 3, 4, 4, 6}));

    const auto back = core::unstack_faces(*cube);
    ASSERT_EQ(back.size(), 6u);
    for (int f = 0; f < 6; ++f) {
        EXPECT_TRUE(torch::equal(back[f], faces[f])) << "face " << f;
    }
}

TEST_F(CubeShapeTest, StackFacesRejectsMismatches) {
    std::vector<torch::Tensor> faces(6, torch::zeros({1, 2, 3, 3}));
    EXPECT_FALSE(core::stack_faces({faces.begin(), faces.begin() + 5}).has_value());

    auto wrong_shape = faces;
    wrong_shape[3] = torch::zeros({1, 2, 3, 4});
    EXPECT_FALSE(core::stack_faces(wrong_shape).has_value());

    auto wrong_dtype = faces;
    wrong_dtype[5] = torch::zeros({1, 2, 3, 3}, torch::kFloat64);
    EXPECT_FALSE(core::stack_faces(wrong_dtype).has_value());

    auto wrong_rank = faces;
    wrong_rank[0] = torch::zeros({2, 3, 3});
    EXPECT_FALSE(core::stack_faces(wrong_rank).has_value());
}

TEST_F(CubeShapeTest, ValidateCubeTensor) {
    auto dims = core::validate_cube_tensor(torch::zeros({2, 3, 5, 7, 6}));
    ASSERT_TRUE(dims.has_value()) << dims.error();
    EXPECT_EQ(dims->batch, 2);
    EXPECT_EQ(dims->channels, 3);
    EXPECT_EQ(dims->height, 5);
    EXPECT_EQ(dims->width, 7);

    EXPECT_FALSE(core::validate_cube_tensor(torch::zeros({2, 3, 5, 6})).has_value());
    EXPECT_FALSE(core::validate_cube_tensor(torch::zeros({2, 3, 5, 5, 4})).has_value());
    EXPECT_TRUE(core::validate_cube_shape({std::nullopt, 3, std::nullopt, std::nullopt, 6}).has_value());
    EXPECT_TRUE(core::validate_cube_shape({1, 3, 4, 4, std::nullopt}).has_value());
}

TEST_F(CubeShapeTest, FormatShapeAndDataFormat) {
    EXPECT_EQ(core::format_shape({std::nullopt, 3, 8, 8, 6}), "(None, 3, 8, 8, 6)");
    EXPECT_EQ(core::format_shape({}), "()");

    EXPECT_EQ(*core::parse_data_format("channels_first"), core::DataFormat::ChannelsFirst);
    EXPECT_EQ(*core::parse_data_format("channels_last"), core::DataFormat::ChannelsLast);
    EXPECT_FALSE(core::parse_data_format("NCHW").has_value());
    EXPECT_EQ(core::to_string(core::DataFormat::ChannelsLast), "channels_last");
}

TEST_F(CubeShapeTest, ActivationValues) {
    using config::Activation;
    const auto x = torch::tensor({-3.0f, -1.0f, 0.0f, 1.0f, 3.0f});

    EXPECT_TRUE(torch::equal(layers::apply_activation(x, Activation::Linear), x));
    EXPECT_TRUE(torch::allclose(layers::apply_activation(x, Activation::HardSigmoid),
                                torch::tensor({0.0f, 0.3f, 0.5f, 0.7f, 1.0f})));
    EXPECT_TRUE(torch::allclose(layers::apply_activation(x, Activation::Softsign),
                                torch::tensor({-0.75f, -0.5f, 0.0f, 0.5f, 0.75f})));
    EXPECT_TRUE(torch::allclose(layers::apply_activation(x, Activation::Relu),
                                torch::tensor({0.0f, 0.0f, 0.0f, 1.0f, 3.0f})));
    EXPECT_TRUE(torch::allclose(layers::apply_activation(x, Activation::Exponential), x.exp()));
    EXPECT_LT(layers::apply_activation(x, Activation::Elu).min().item<float>(), 0.0f);
    EXPECT_GT(layers::apply_activation(x, Activation::Softplus).min().item<float>(), 0.0f);
}
