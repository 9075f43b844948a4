/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "config/layer_config.hpp"
#include "cube_layer.hpp"
#include <expected>
#include <string>
#include <torch/torch.h>

namespace csn::layers {

    /**
     * @brief Fills a halo of width p around every cube face from its geometric neighbours
     *
     * Pass 1 pads the height axis from the Top/Bottom neighbours, pass 2 pads the
     * width axis from the Left/Right neighbours of the pass-1 result, so corner
     * cells come from the width neighbour's height halo. Inputs are never modified.
     */
    class CubeHaloPadder final : public ICubeLayer {
    public:
        static constexpr std::string_view CLASS_NAME = "CubeSpherePadding2D";

        static std::expected<CubeHaloPadder, std::string> create(const config::PadderConfig& config);

        /**
         * @brief Pad a cube-sphere tensor
         * @param input [B, C, N, N, 6]
         * @param p Halo width, 0 <= p <= N
         * @return [B, C, N+2p, N+2p, 6] or an invalid-argument error
         */
        static std::expected<torch::Tensor, std::string> pad(const torch::Tensor& input, int64_t p);

        std::expected<torch::Tensor, std::string> forward(const torch::Tensor& input) override;
        std::expected<core::Shape, std::string> compute_output_shape(const core::Shape& input_shape) const override;
        nlohmann::json get_config() const override;
        std::string_view class_name() const override { return CLASS_NAME; }

        const config::PadderConfig& config() const { return config_; }
        int64_t padding() const { return config_.padding; }

    private:
        explicit CubeHaloPadder(config::PadderConfig config) : config_(std::move(config)) {}

        config::PadderConfig config_;
    };

} // namespace csn::layers
