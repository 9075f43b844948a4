/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "config/layer_config.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace csn;
using namespace csn::config;

class LayerConfigTest : public ::testing::Test {};

TEST_F(LayerConfigTest, ConvDefaults) {
    auto config = conv_config_from_json({{"filters", 16}, {"kernel_size", 3}});
    ASSERT_TRUE(config.has_value()) << config.error();

    EXPECT_EQ(config->filters, 16);
    EXPECT_EQ(config->kernel_size, (std::array<int64_t, 2>{3, 3}));
    EXPECT_EQ(config->strides, (std::array<int64_t, 2>{1, 1}));
    EXPECT_EQ(config->dilation_rate, (std::array<int64_t, 2>{1, 1}));
    EXPECT_EQ(config->padding, PaddingMode::Valid);
    EXPECT_EQ(config->data_format, core::DataFormat::ChannelsFirst);
    EXPECT_EQ(config->activation, Activation::Linear);
    EXPECT_TRUE(config->use_bias);
    EXPECT_TRUE(config->flip_north_pole);
    EXPECT_FALSE(config->independent_north_pole);
    EXPECT_EQ(config->kernel_initializer.kind, InitializerSpec::Kind::GlorotUniform);
    EXPECT_EQ(config->bias_initializer.kind, InitializerSpec::Kind::Zeros);
    EXPECT_FALSE(config->kernel_regularizer.has_value());
    EXPECT_FALSE(config->kernel_constraint.has_value());
}

TEST_F(LayerConfigTest, ConvFullRecord) {
    const auto j = nlohmann::json::parse(R"({
        "name": "cube_conv",
        "filters": 8,
        "kernel_size": [3, 5],
        "strides": [1, 1],
        "padding": "same",
        "data_format": "channels_first",
        "dilation_rate": 2,
        "activation": "elu",
        "use_bias": false,
        "flip_north_pole": false,
        "independent_north_pole": true,
        "kernel_initializer": {"class_name": "RandomNormal", "config": {"mean": 0.0, "stddev": 0.1}},
        "bias_initializer": "ones",
        "kernel_regularizer": {"class_name": "L1L2", "config": {"l1": 0.001, "l2": 0.01}},
        "bias_regularizer": null,
        "activity_regularizer": {"class_name": "L2", "config": {}},
        "kernel_constraint": {"class_name": "MaxNorm", "config": {"max_value": 3.0, "axis": [0, 1, 2]}},
        "bias_constraint": "non_neg"
    })");

    auto config = conv_config_from_json(j);
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->name, "cube_conv");
    EXPECT_EQ(config->kernel_size, (std::array<int64_t, 2>{3, 5}));
    EXPECT_EQ(config->dilation_rate, (std::array<int64_t, 2>{2, 2}));
    EXPECT_EQ(config->padding, PaddingMode::Same);
    EXPECT_EQ(config->activation, Activation::Elu);
    EXPECT_FALSE(config->use_bias);
    EXPECT_FALSE(config->flip_north_pole);
    EXPECT_TRUE(config->independent_north_pole);
    EXPECT_EQ(config->kernel_initializer.kind, InitializerSpec::Kind::RandomNormal);
    EXPECT_DOUBLE_EQ(config->kernel_initializer.stddev, 0.1);
    EXPECT_EQ(config->bias_initializer.kind, InitializerSpec::Kind::Ones);

    ASSERT_TRUE(config->kernel_regularizer.has_value());
    EXPECT_DOUBLE_EQ(config->kernel_regularizer->l1, 0.001);
    EXPECT_DOUBLE_EQ(config->kernel_regularizer->l2, 0.01);
    EXPECT_FALSE(config->bias_regularizer.has_value());
    ASSERT_TRUE(config->activity_regularizer.has_value());
    EXPECT_DOUBLE_EQ(config->activity_regularizer->l1, 0.0);
    EXPECT_DOUBLE_EQ(config->activity_regularizer->l2, 0.01);

    ASSERT_TRUE(config->kernel_constraint.has_value());
    EXPECT_EQ(config->kernel_constraint->kind, ConstraintSpec::Kind::MaxNorm);
    EXPECT_DOUBLE_EQ(config->kernel_constraint->max_value, 3.0);
    ASSERT_TRUE(config->bias_constraint.has_value());
    EXPECT_EQ(config->bias_constraint->kind, ConstraintSpec::Kind::NonNeg);

    // Serialising and parsing again reproduces the same record
    const auto first = to_json(*config);
    auto reparsed = conv_config_from_json(first);
    ASSERT_TRUE(reparsed.has_value()) << reparsed.error();
    EXPECT_EQ(to_json(*reparsed), first);
}

TEST_F(LayerConfigTest, NullActivationIsLinear) {
    auto config = conv_config_from_json({{"filters", 4}, {"kernel_size", 1}, {"activation", nullptr}});
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->activation, Activation::Linear);
}

TEST_F(LayerConfigTest, ConvErrors) {
    EXPECT_FALSE(conv_config_from_json({{"kernel_size", 3}}).has_value());
    EXPECT_FALSE(conv_config_from_json({{"filters", 4}}).has_value());
    EXPECT_FALSE(conv_config_from_json({{"filters", 4}, {"kernel_size", {1, 2, 3}}}).has_value());
    EXPECT_FALSE(conv_config_from_json({{"filters", 4}, {"kernel_size", 3}, {"activation", "swish"}}).has_value());
    EXPECT_FALSE(conv_config_from_json({{"filters", 4}, {"kernel_size", 3}, {"padding", "causal"}}).has_value());
    EXPECT_FALSE(conv_config_from_json({{"filters", 4}, {"kernel_size", 3}, {"data_format", "nhwc"}}).has_value());
    EXPECT_FALSE(conv_config_from_json({{"filters", "four"}, {"kernel_size", 3}}).has_value());
    EXPECT_FALSE(conv_config_from_json(nlohmann::json::array()).has_value());

    auto bad_reg = conv_config_from_json(
        {{"filters", 4}, {"kernel_size", 3}, {"kernel_regularizer", {{"class_name", "L3"}, {"config", nlohmann::json::object()}}}});
    ASSERT_FALSE(bad_reg.has_value());
    EXPECT_NE(bad_reg.error().find("L3"), std::string::npos) << bad_reg.error();
}

TEST_F(LayerConfigTest, PadderConfig) {
    auto config = padder_config_from_json({{"padding", 2}, {"name", "halo"}});
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->padding, 2);
    EXPECT_EQ(config->name, "halo");
    EXPECT_EQ(config->data_format, core::DataFormat::ChannelsFirst);

    auto pair = padder_config_from_json({{"padding", {3, 3}}});
    ASSERT_TRUE(pair.has_value()) << pair.error();
    EXPECT_EQ(pair->padding, 3);

    auto defaults = padder_config_from_json(nlohmann::json::object());
    ASSERT_TRUE(defaults.has_value()) << defaults.error();
    EXPECT_EQ(defaults->padding, 1);

    EXPECT_FALSE(padder_config_from_json({{"padding", {1, 2}}}).has_value());
    EXPECT_FALSE(padder_config_from_json({{"padding", "one"}}).has_value());

    const auto j = to_json(*config);
    EXPECT_EQ(j["padding"], 2);
    EXPECT_EQ(j["data_format"], "channels_first");
}

TEST_F(LayerConfigTest, EnumNames) {
    for (const auto a : {Activation::Linear, Activation::Relu, Activation::Tanh, Activation::Sigmoid,
                         Activation::HardSigmoid, Activation::Elu, Activation::Selu, Activation::Softplus,
                         Activation::Softsign, Activation::Exponential}) {
        auto parsed = parse_activation(to_string(a));
        ASSERT_TRUE(parsed.has_value()) << parsed.error();
        EXPECT_EQ(*parsed, a);
    }
    EXPECT_EQ(*parse_initializer_kind("GlorotNormal"), InitializerSpec::Kind::GlorotNormal);
    EXPECT_EQ(*parse_initializer_kind("he_uniform"), InitializerSpec::Kind::HeUniform);
    EXPECT_EQ(*parse_constraint_kind("UnitNorm"), ConstraintSpec::Kind::UnitNorm);
    EXPECT_FALSE(parse_padding_mode("full").has_value());
}

TEST_F(LayerConfigTest, SpecRecords) {
    EXPECT_TRUE(to_json(std::optional<RegularizerSpec>{}).is_null());
    EXPECT_TRUE(to_json(std::optional<ConstraintSpec>{}).is_null());

    const auto init = to_json(InitializerSpec{.kind = InitializerSpec::Kind::Constant, .value = 0.5});
    EXPECT_EQ(init["class_name"], "Constant");
    EXPECT_DOUBLE_EQ(init["config"]["value"].get<double>(), 0.5);

    auto reg = regularizer_from_json({{"class_name", "L1"}, {"config", nlohmann::json::object()}});
    ASSERT_TRUE(reg.has_value()) << reg.error();
    ASSERT_TRUE(reg->has_value());
    EXPECT_DOUBLE_EQ((*reg)->l1, 0.01);
    EXPECT_DOUBLE_EQ((*reg)->l2, 0.0);

    EXPECT_FALSE(regularizer_from_json({{"class_name", "L1L2"}, {"config", {{"l1", -1.0}}}}).has_value());
    EXPECT_FALSE(constraint_from_json({{"class_name", "MaxNorm"}, {"config", {{"max_value", 0.0}}}}).has_value());
    EXPECT_FALSE(initializer_from_json(42).has_value());
}
