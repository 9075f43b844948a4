/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/cube_shape.hpp"
#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <torch/torch.h>

namespace csn::layers {

    using NamedTensor = std::pair<std::string, torch::Tensor>;

    class ICubeLayer {
    public:
        virtual ~ICubeLayer() = default;

        // [B, C, H, W, 6] in, [B, C', H', W', 6] out
        virtual std::expected<torch::Tensor, std::string> forward(const torch::Tensor& input) = 0;

        // Shape inference without running the layer
        virtual std::expected<core::Shape, std::string> compute_output_shape(const core::Shape& input_shape) const = 0;

        // Config record sufficient to reconstruct an identical layer (weights excluded)
        virtual nlohmann::json get_config() const = 0;

        virtual std::string_view class_name() const = 0;

        virtual std::vector<torch::Tensor> parameters() const { return {}; }
        virtual std::vector<NamedTensor> named_parameters() const { return {}; }
    };

    // Seam for alternative cube-sphere convolutions (e.g. rotation-group kernels)
    class ICubeConvolution : public ICubeLayer {
    public:
        // Allocate weights once the channel dimension of the input is known
        virtual std::expected<void, std::string> build(const core::Shape& input_shape) = 0;

        virtual bool is_built() const = 0;

        // Sum of weight regularization penalties, a scalar tensor (zero if none)
        virtual torch::Tensor regularization_loss() const = 0;

        // Project weights back onto their constraint sets, outside autograd
        virtual void apply_constraints() = 0;
    };

} // namespace csn::layers
