/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "cube_sphere_conv2d.hpp"
#include "activations.hpp"
#include "core/logger.hpp"
#include "initializers.hpp"
#include "regularization.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace csn::layers {

    using config::PaddingMode;
    using topology::FaceGroup;

    namespace {
        constexpr int64_t FACE_WIDTH_AXIS = 3; ///< width axis of a [B, C, H, W] face
        constexpr std::array<int64_t, 2> NO_PADDING{0, 0};

        size_t group_index(const FaceGroup group) {
            return static_cast<size_t>(group);
        }

        // (kH, kW, in, out) -> (out, in, kH, kW) as expected by conv2d
        torch::Tensor to_oihw(const torch::Tensor& kernel) {
            return kernel.permute({3, 2, 0, 1});
        }

        // Padding before/after for "same": the extra cell, if any, goes after
        std::pair<int64_t, int64_t> same_padding(const int64_t n, const int64_t k,
                                                 const int64_t stride, const int64_t dilation) {
            const int64_t out = (n + stride - 1) / stride;
            const int64_t total = std::max<int64_t>((out - 1) * stride + (k - 1) * dilation + 1 - n, 0);
            return {total / 2, total - total / 2};
        }
    } // namespace

    std::expected<CubeSphereConv2D, std::string> CubeSphereConv2D::create(const config::ConvConfig& config) {
        if (config.data_format != core::DataFormat::ChannelsFirst) {
            return std::unexpected(std::format(
                "Invalid argument: {} must have 'channels_first' order, got {}",
                CLASS_NAME, core::to_string(config.data_format)));
        }
        if (config.filters <= 0) {
            return std::unexpected(std::format("Invalid argument: filters must be positive, got {}", config.filters));
        }
        for (int i = 0; i < 2; ++i) {
            if (config.kernel_size[i] <= 0 || config.strides[i] <= 0 || config.dilation_rate[i] <= 0) {
                return std::unexpected(std::format(
                    "Invalid argument: kernel_size ({}, {}), strides ({}, {}) and dilation_rate ({}, {}) must be positive",
                    config.kernel_size[0], config.kernel_size[1], config.strides[0], config.strides[1],
                    config.dilation_rate[0], config.dilation_rate[1]));
            }
        }
        const bool strided = config.strides[0] != 1 || config.strides[1] != 1;
        const bool dilated = config.dilation_rate[0] != 1 || config.dilation_rate[1] != 1;
        if (strided && dilated) {
            return std::unexpected("Invalid argument: strides != 1 cannot be combined with dilation_rate != 1");
        }

        LOG_DEBUG("Created {} '{}': {} filters, kernel {}x{}, padding {}, flip_north_pole={}, independent_north_pole={}",
                  CLASS_NAME, config.name, config.filters, config.kernel_size[0], config.kernel_size[1],
                  config::to_string(config.padding), config.flip_north_pole, config.independent_north_pole);
        return CubeSphereConv2D(config);
    }

    std::expected<void, std::string> CubeSphereConv2D::build(const core::Shape& input_shape) {
        return build(input_shape, torch::TensorOptions().dtype(torch::kFloat32));
    }

    std::expected<void, std::string> CubeSphereConv2D::build(const core::Shape& input_shape,
                                                             const torch::TensorOptions& options) {
        if (auto valid = core::validate_cube_shape(input_shape); !valid) {
            return std::unexpected(valid.error());
        }
        const auto& channels = input_shape[core::CHANNEL_AXIS];
        if (!channels) {
            return std::unexpected("Invalid argument: the channel dimension of the inputs should be defined, found None");
        }
        if (*channels <= 0) {
            return std::unexpected(std::format("Invalid argument: channel dimension must be positive, got {}", *channels));
        }
        if (is_built()) {
            if (*channels != input_channels_) {
                return std::unexpected(std::format(
                    "Invalid argument: layer was built for {} input channels, got {}", input_channels_, *channels));
            }
            return {};
        }

        try {
            const std::vector<int64_t> kernel_shape{
                config_.kernel_size[0], config_.kernel_size[1], *channels, config_.filters};
            const std::vector<int64_t> bias_shape{config_.filters};

            const auto make_group = [&]() {
                GroupWeights w;
                w.kernel = initialize(config_.kernel_initializer, kernel_shape, options).requires_grad_(true);
                if (config_.use_bias) {
                    w.bias = initialize(config_.bias_initializer, bias_shape, options).requires_grad_(true);
                }
                return w;
            };

            groups_[group_index(FaceGroup::Equatorial)] = make_group();
            groups_[group_index(FaceGroup::SouthPole)] = make_group();
            groups_[group_index(FaceGroup::NorthPole)] = config_.independent_north_pole
                                                             ? make_group()
                                                             : groups_[group_index(FaceGroup::SouthPole)];
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Error allocating {} weights: {}", CLASS_NAME, e.what()));
        }
        input_channels_ = *channels;

        LOG_DEBUG("Built {} '{}': kernel ({}, {}, {}, {}), {} weight groups",
                  CLASS_NAME, config_.name, config_.kernel_size[0], config_.kernel_size[1],
                  input_channels_, config_.filters, config_.independent_north_pole ? 3 : 2);
        return {};
    }

    int64_t CubeSphereConv2D::output_length(const int64_t input_length, const int64_t kernel,
                                            const PaddingMode padding, const int64_t stride,
                                            const int64_t dilation) {
        const int64_t dilated_kernel = (kernel - 1) * dilation + 1;
        const int64_t length = padding == PaddingMode::Same ? input_length : input_length - dilated_kernel + 1;
        if (length <= 0) {
            return 0;
        }
        return (length + stride - 1) / stride;
    }

    torch::Tensor CubeSphereConv2D::convolve_face(const torch::Tensor& face, const GroupWeights& weights) const {
        auto x = face;
        if (config_.padding == PaddingMode::Same) {
            const auto [top, bottom] = same_padding(face.size(2), config_.kernel_size[0],
                                                    config_.strides[0], config_.dilation_rate[0]);
            const auto [left, right] = same_padding(face.size(3), config_.kernel_size[1],
                                                    config_.strides[1], config_.dilation_rate[1]);
            if (top + bottom + left + right > 0) {
                x = torch::constant_pad_nd(x, {left, right, top, bottom}, 0.0);
            }
        }
        return torch::conv2d(x, to_oihw(weights.kernel), weights.bias,
                             config_.strides, NO_PADDING, config_.dilation_rate);
    }

    std::expected<torch::Tensor, std::string> CubeSphereConv2D::forward(const torch::Tensor& input) {
        auto dims = core::validate_cube_tensor(input);
        if (!dims) {
            return std::unexpected(dims.error());
        }
        if (!is_built()) {
            if (auto built = build(core::shape_of(input), input.options()); !built) {
                return std::unexpected(built.error());
            }
        }
        if (dims->channels != input_channels_) {
            return std::unexpected(std::format(
                "Invalid argument: layer was built for {} input channels, got {}", input_channels_, dims->channels));
        }
        const auto out_h = output_length(dims->height, config_.kernel_size[0], config_.padding,
                                         config_.strides[0], config_.dilation_rate[0]);
        const auto out_w = output_length(dims->width, config_.kernel_size[1], config_.padding,
                                         config_.strides[1], config_.dilation_rate[1]);
        if (out_h <= 0 || out_w <= 0) {
            return std::unexpected(std::format(
                "Invalid argument: face {}x{} is too small for a {}x{} kernel with dilation ({}, {})",
                dims->height, dims->width, config_.kernel_size[0], config_.kernel_size[1],
                config_.dilation_rate[0], config_.dilation_rate[1]));
        }

        try {
            LOG_TIMER_TRACE("CubeSphereConv2D::forward");

            // Faces are independent; each output is a fresh tensor, stacked once in face order
            std::vector<torch::Tensor> outputs;
            outputs.reserve(static_cast<size_t>(topology::NUM_FACES));
            for (int f = 0; f < topology::NUM_FACES; ++f) {
                const auto group = topology::face_group(f);
                const bool flip = group == FaceGroup::NorthPole && config_.flip_north_pole;

                auto face = input.select(core::FACE_AXIS, f);
                if (flip) {
                    face = face.flip({FACE_WIDTH_AXIS});
                }
                auto out = convolve_face(face, weights_for(group));
                if (flip) {
                    out = out.flip({FACE_WIDTH_AXIS});
                }
                outputs.push_back(std::move(out));
            }

            return apply_activation(torch::stack(outputs, core::FACE_AXIS), config_.activation);
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Error in {} forward: {}", CLASS_NAME, e.what()));
        }
    }

    std::expected<core::Shape, std::string> CubeSphereConv2D::compute_output_shape(const core::Shape& input_shape) const {
        if (auto valid = core::validate_cube_shape(input_shape); !valid) {
            return std::unexpected(valid.error());
        }
        const auto& channels = input_shape[core::CHANNEL_AXIS];
        if (is_built() && channels && *channels != input_channels_) {
            return std::unexpected(std::format(
                "Invalid argument: layer was built for {} input channels, got {}", input_channels_, *channels));
        }

        core::Shape out{input_shape[core::BATCH_AXIS], config_.filters, std::nullopt, std::nullopt, core::NUM_FACES};
        for (int i = 0; i < 2; ++i) {
            const auto& dim = input_shape[core::HEIGHT_AXIS + i];
            if (!dim)
                continue;
            const auto length = output_length(*dim, config_.kernel_size[i], config_.padding,
                                              config_.strides[i], config_.dilation_rate[i]);
            if (length <= 0) {
                return std::unexpected(std::format(
                    "Invalid argument: spatial size {} is too small for kernel size {} with dilation {}",
                    *dim, config_.kernel_size[i], config_.dilation_rate[i]));
            }
            out[core::HEIGHT_AXIS + i] = length;
        }
        return out;
    }

    nlohmann::json CubeSphereConv2D::get_config() const {
        return config::to_json(config_);
    }

    const CubeSphereConv2D::GroupWeights& CubeSphereConv2D::weights_for(const FaceGroup group) const {
        return groups_[group_index(group)];
    }

    std::vector<const CubeSphereConv2D::GroupWeights*> CubeSphereConv2D::distinct_groups() const {
        std::vector<const GroupWeights*> groups{
            &groups_[group_index(FaceGroup::Equatorial)],
            &groups_[group_index(FaceGroup::SouthPole)]};
        if (config_.independent_north_pole) {
            groups.push_back(&groups_[group_index(FaceGroup::NorthPole)]);
        }
        return groups;
    }

    std::vector<torch::Tensor> CubeSphereConv2D::parameters() const {
        std::vector<torch::Tensor> params;
        for (const auto& [name, tensor] : named_parameters()) {
            params.push_back(tensor);
        }
        return params;
    }

    std::vector<NamedTensor> CubeSphereConv2D::named_parameters() const {
        if (!is_built())
            return {};

        std::vector<NamedTensor> params;
        const auto add = [&](const FaceGroup group, std::string_view prefix) {
            const auto& w = groups_[group_index(group)];
            params.emplace_back(std::format("{}_kernel", prefix), w.kernel);
            if (w.bias.defined()) {
                params.emplace_back(std::format("{}_bias", prefix), w.bias);
            }
        };
        add(FaceGroup::Equatorial, "equatorial");
        add(FaceGroup::SouthPole, "polar");
        if (config_.independent_north_pole) {
            add(FaceGroup::NorthPole, "north_pole");
        }
        return params;
    }

    torch::Tensor CubeSphereConv2D::regularization_loss() const {
        if (!is_built())
            return torch::scalar_tensor(0.0, torch::kFloat32);

        auto loss = torch::scalar_tensor(0.0, weights_for(FaceGroup::Equatorial).kernel.options());
        for (const auto* w : distinct_groups()) {
            if (config_.kernel_regularizer) {
                loss = loss + regularization_penalty(w->kernel, *config_.kernel_regularizer);
            }
            if (config_.bias_regularizer && w->bias.defined()) {
                loss = loss + regularization_penalty(w->bias, *config_.bias_regularizer);
            }
        }
        return loss;
    }

    torch::Tensor CubeSphereConv2D::activity_regularization_loss(const torch::Tensor& output) const {
        if (!config_.activity_regularizer) {
            return torch::scalar_tensor(0.0, output.options());
        }
        return regularization_penalty(output, *config_.activity_regularizer);
    }

    void CubeSphereConv2D::apply_constraints() {
        if (!is_built())
            return;

        for (const auto* w : distinct_groups()) {
            // The tensors are shared handles; constraining a copy updates the parameter storage
            auto kernel = w->kernel;
            auto bias = w->bias;
            if (config_.kernel_constraint) {
                apply_constraint(kernel, *config_.kernel_constraint);
            }
            if (config_.bias_constraint && bias.defined()) {
                apply_constraint(bias, *config_.bias_constraint);
            }
        }
    }

    std::expected<void, std::string> CubeSphereConv2D::set_weights(const FaceGroup group,
                                                                   const torch::Tensor& kernel,
                                                                   const torch::Tensor& bias) {
        if (!is_built()) {
            return std::unexpected("Invalid argument: layer must be built before its weights are set");
        }
        if (group == FaceGroup::NorthPole && !config_.independent_north_pole) {
            return std::unexpected("Invalid argument: the north pole shares the polar weights; set SouthPole instead");
        }

        auto& target = groups_[group_index(group)];
        if (!kernel.defined() || kernel.sizes() != target.kernel.sizes()) {
            return std::unexpected(std::format(
                "Invalid argument: {} kernel must have shape {}, got {}",
                topology::to_string(group), core::format_shape(core::shape_of(target.kernel)),
                kernel.defined() ? core::format_shape(core::shape_of(kernel)) : std::string{"undefined"}));
        }
        if (config_.use_bias && (!bias.defined() || bias.sizes() != target.bias.sizes())) {
            return std::unexpected(std::format(
                "Invalid argument: {} bias must have shape ({})", topology::to_string(group), config_.filters));
        }

        try {
            torch::NoGradGuard no_grad;
            target.kernel.copy_(kernel);
            if (config_.use_bias) {
                target.bias.copy_(bias);
            }
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Error setting {} weights: {}", topology::to_string(group), e.what()));
        }
        return {};
    }

} // namespace csn::layers
