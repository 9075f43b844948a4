/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "config/layer_config.hpp"
#include "cube_layer.hpp"
#include "topology/cube_topology.hpp"
#include <array>
#include <expected>
#include <string>
#include <torch/torch.h>

namespace csn::layers {

    /**
     * @brief 2D convolution on cube-sphere data with weights shared per face group
     *
     * Faces 0-3 share the equatorial kernel, face 4 uses the polar kernel and face 5
     * either the polar kernel or its own (independent_north_pole). With
     * flip_north_pole, face 5 is mirrored along width before and after the
     * convolution so its rotational sense matches the south pole.
     *
     * Kernels are stored (kH, kW, in, filters); biases (filters). Weights are
     * allocated by build() or lazily by the first forward() and never resized.
     */
    class CubeSphereConv2D final : public ICubeConvolution {
    public:
        static constexpr std::string_view CLASS_NAME = "CubeSphereConv2D";

        struct GroupWeights {
            torch::Tensor kernel;
            torch::Tensor bias; ///< undefined when use_bias is off
        };

        static std::expected<CubeSphereConv2D, std::string> create(const config::ConvConfig& config);

        std::expected<void, std::string> build(const core::Shape& input_shape) override;
        std::expected<void, std::string> build(const core::Shape& input_shape, const torch::TensorOptions& options);
        bool is_built() const override { return input_channels_ > 0; }

        std::expected<torch::Tensor, std::string> forward(const torch::Tensor& input) override;
        std::expected<core::Shape, std::string> compute_output_shape(const core::Shape& input_shape) const override;
        nlohmann::json get_config() const override;
        std::string_view class_name() const override { return CLASS_NAME; }

        std::vector<torch::Tensor> parameters() const override;
        std::vector<NamedTensor> named_parameters() const override;

        torch::Tensor regularization_loss() const override;
        torch::Tensor activity_regularization_loss(const torch::Tensor& output) const;
        void apply_constraints() override;

        // Weights used by a face group; NorthPole aliases the polar weights unless independent
        const GroupWeights& weights_for(topology::FaceGroup group) const;

        /**
         * @brief Overwrite the weights of one group in place (autograd leaves are kept)
         * @param bias Ignored when use_bias is off
         */
        std::expected<void, std::string> set_weights(topology::FaceGroup group,
                                                     const torch::Tensor& kernel,
                                                     const torch::Tensor& bias = {});

        const config::ConvConfig& config() const { return config_; }
        int64_t input_channels() const { return input_channels_; }

        // Output length along one spatial axis; <= 0 means the input is too small
        static int64_t output_length(int64_t input_length, int64_t kernel, config::PaddingMode padding,
                                     int64_t stride, int64_t dilation);

    private:
        explicit CubeSphereConv2D(config::ConvConfig config) : config_(std::move(config)) {}

        // face [B, C, H, W] -> [B, filters, H', W']
        torch::Tensor convolve_face(const torch::Tensor& face, const GroupWeights& weights) const;

        // Distinct weight sets: equatorial, polar and (if independent) north pole
        std::vector<const GroupWeights*> distinct_groups() const;

        config::ConvConfig config_;
        int64_t input_channels_ = 0;
        std::array<GroupWeights, 3> groups_; ///< indexed by topology::FaceGroup
    };

} // namespace csn::layers
