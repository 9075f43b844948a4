/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/cube_shape.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csn::config {

    enum class PaddingMode : uint8_t {
        Valid,
        Same
    };

    enum class Activation : uint8_t {
        Linear,
        Relu,
        Tanh,
        Sigmoid,
        HardSigmoid,
        Elu,
        Selu,
        Softplus,
        Softsign,
        Exponential
    };

    struct InitializerSpec {
        enum class Kind : uint8_t {
            Zeros,
            Ones,
            Constant,
            RandomUniform,
            RandomNormal,
            GlorotUniform,
            GlorotNormal,
            HeUniform,
            HeNormal,
            LecunUniform,
            LecunNormal
        };

        Kind kind = Kind::GlorotUniform;
        double value = 0.0;    ///< Constant
        double minval = -0.05; ///< RandomUniform
        double maxval = 0.05;  ///< RandomUniform
        double mean = 0.0;     ///< RandomNormal
        double stddev = 0.05;  ///< RandomNormal
    };

    // penalty = l1 * sum(|w|) + l2 * sum(w^2)
    struct RegularizerSpec {
        double l1 = 0.0;
        double l2 = 0.0;
    };

    struct ConstraintSpec {
        enum class Kind : uint8_t {
            NonNeg,
            MaxNorm,
            UnitNorm
        };

        Kind kind = Kind::NonNeg;
        double max_value = 2.0;                 ///< MaxNorm
        std::vector<int64_t> axis = {0, 1, 2}; ///< Norm axes of a (kH, kW, in, out) kernel
    };

    struct PadderConfig {
        int64_t padding = 1;
        core::DataFormat data_format = core::DataFormat::ChannelsFirst;
        std::string name;
    };

    struct ConvConfig {
        int64_t filters = 0;
        std::array<int64_t, 2> kernel_size{3, 3};
        std::array<int64_t, 2> strides{1, 1};
        PaddingMode padding = PaddingMode::Valid;
        core::DataFormat data_format = core::DataFormat::ChannelsFirst;
        std::array<int64_t, 2> dilation_rate{1, 1};
        Activation activation = Activation::Linear;
        bool use_bias = true;
        bool flip_north_pole = true;
        bool independent_north_pole = false;
        InitializerSpec kernel_initializer{};
        InitializerSpec bias_initializer{.kind = InitializerSpec::Kind::Zeros};
        std::optional<RegularizerSpec> kernel_regularizer;
        std::optional<RegularizerSpec> bias_regularizer;
        std::optional<RegularizerSpec> activity_regularizer;
        std::optional<ConstraintSpec> kernel_constraint;
        std::optional<ConstraintSpec> bias_constraint;
        std::string name;
    };

    std::expected<PaddingMode, std::string> parse_padding_mode(std::string_view name);
    std::string_view to_string(PaddingMode mode);

    std::expected<Activation, std::string> parse_activation(std::string_view name);
    std::string_view to_string(Activation activation);

    std::expected<InitializerSpec::Kind, std::string> parse_initializer_kind(std::string_view name);
    std::string_view to_string(InitializerSpec::Kind kind);

    std::expected<ConstraintSpec::Kind, std::string> parse_constraint_kind(std::string_view name);
    std::string_view to_string(ConstraintSpec::Kind kind);

    // Specs serialise as {"class_name": ..., "config": {...}}, absent optionals as null
    nlohmann::json to_json(const InitializerSpec& spec);
    nlohmann::json to_json(const std::optional<RegularizerSpec>& spec);
    nlohmann::json to_json(const std::optional<ConstraintSpec>& spec);
    nlohmann::json to_json(const PadderConfig& config);
    nlohmann::json to_json(const ConvConfig& config);

    std::expected<InitializerSpec, std::string> initializer_from_json(const nlohmann::json& j);
    std::expected<std::optional<RegularizerSpec>, std::string> regularizer_from_json(const nlohmann::json& j);
    std::expected<std::optional<ConstraintSpec>, std::string> constraint_from_json(const nlohmann::json& j);

    /**
     * @brief Parse a padder config; missing keys take their defaults
     */
    std::expected<PadderConfig, std::string> padder_config_from_json(const nlohmann::json& j);

    /**
     * @brief Parse a convolution config; `filters` and `kernel_size` are required
     */
    std::expected<ConvConfig, std::string> conv_config_from_json(const nlohmann::json& j);

} // namespace csn::config
