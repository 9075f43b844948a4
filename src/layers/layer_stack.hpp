/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "cube_layer.hpp"
#include <expected>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <torch/torch.h>

namespace csn::layers {

    inline constexpr int STACK_JSON_VERSION = 1;

    /**
     * @brief Reconstruct a layer from {"class_name": ..., "config": {...}}
     *
     * Known classes: CubeSpherePadding2D, CubeSphereConv2D.
     */
    std::expected<std::unique_ptr<ICubeLayer>, std::string> layer_from_json(const nlohmann::json& j);

    // Sequential chain of cube-sphere layers
    class LayerStack {
    public:
        void add(std::unique_ptr<ICubeLayer> layer);
        void clear() { layers_.clear(); }

        [[nodiscard]] bool empty() const { return layers_.empty(); }
        [[nodiscard]] size_t size() const { return layers_.size(); }
        [[nodiscard]] ICubeLayer& at(size_t index) { return *layers_.at(index); }
        [[nodiscard]] const ICubeLayer& at(size_t index) const { return *layers_.at(index); }

        // Runs every layer in order, stops at the first error
        std::expected<torch::Tensor, std::string> forward(const torch::Tensor& input);

        /**
         * @brief Chain shape inference through all layers
         * @return Final shape, or an error naming the index and class of the failing layer
         */
        std::expected<core::Shape, std::string> compute_output_shape(const core::Shape& input_shape) const;

        // Parameters of every layer, names prefixed "layer{i}."
        std::vector<NamedTensor> named_parameters() const;
        std::vector<torch::Tensor> parameters() const;

        // Sum of regularization losses over the convolution layers
        torch::Tensor regularization_loss() const;
        void apply_constraints();

        // Architecture only; weights are not serialised
        nlohmann::json to_json() const;
        static std::expected<LayerStack, std::string> from_json(const nlohmann::json& j);

        [[nodiscard]] bool save_to_json(const std::string& path) const;
        [[nodiscard]] bool load_from_json(const std::string& path);

    private:
        std::vector<std::unique_ptr<ICubeLayer>> layers_;
    };

} // namespace csn::layers
