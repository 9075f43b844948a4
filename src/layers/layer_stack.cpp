/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layer_stack.hpp"
#include "core/logger.hpp"
#include "cube_halo_padder.hpp"
#include "cube_sphere_conv2d.hpp"
#include <format>
#include <fstream>
#include <optional>

namespace csn::layers {

    std::expected<std::unique_ptr<ICubeLayer>, std::string> layer_from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("class_name") || !j["class_name"].is_string()) {
            return std::unexpected("Invalid argument: layer record must be an object with a string 'class_name'");
        }
        const auto class_name = j["class_name"].get<std::string>();
        const auto config = j.value("config", nlohmann::json::object());

        if (class_name == CubeHaloPadder::CLASS_NAME) {
            auto cfg = config::padder_config_from_json(config);
            if (!cfg) {
                return std::unexpected(cfg.error());
            }
            auto layer = CubeHaloPadder::create(*cfg);
            if (!layer) {
                return std::unexpected(layer.error());
            }
            return std::make_unique<CubeHaloPadder>(std::move(*layer));
        }
        if (class_name == CubeSphereConv2D::CLASS_NAME) {
            auto cfg = config::conv_config_from_json(config);
            if (!cfg) {
                return std::unexpected(cfg.error());
            }
            auto layer = CubeSphereConv2D::create(*cfg);
            if (!layer) {
                return std::unexpected(layer.error());
            }
            return std::make_unique<CubeSphereConv2D>(std::move(*layer));
        }
        return std::unexpected(std::format("Invalid argument: unknown layer class '{}'", class_name));
    }

    void LayerStack::add(std::unique_ptr<ICubeLayer> layer) {
        if (layer) {
            layers_.push_back(std::move(layer));
        }
    }

    std::expected<torch::Tensor, std::string> LayerStack::forward(const torch::Tensor& input) {
        auto x = input;
        for (size_t i = 0; i < layers_.size(); ++i) {
            auto out = layers_[i]->forward(x);
            if (!out) {
                return std::unexpected(std::format("layer {} ({}): {}", i, layers_[i]->class_name(), out.error()));
            }
            x = std::move(*out);
        }
        return x;
    }

    std::expected<core::Shape, std::string> LayerStack::compute_output_shape(const core::Shape& input_shape) const {
        auto shape = input_shape;
        for (size_t i = 0; i < layers_.size(); ++i) {
            auto out = layers_[i]->compute_output_shape(shape);
            if (!out) {
                return std::unexpected(std::format("layer {} ({}) with input {}: {}",
                                                   i, layers_[i]->class_name(), core::format_shape(shape), out.error()));
            }
            shape = std::move(*out);
        }
        return shape;
    }

    std::vector<NamedTensor> LayerStack::named_parameters() const {
        std::vector<NamedTensor> params;
        for (size_t i = 0; i < layers_.size(); ++i) {
            for (auto& [name, tensor] : layers_[i]->named_parameters()) {
                params.emplace_back(std::format("layer{}.{}", i, name), tensor);
            }
        }
        return params;
    }

    std::vector<torch::Tensor> LayerStack::parameters() const {
        std::vector<torch::Tensor> params;
        for (const auto& layer : layers_) {
            auto p = layer->parameters();
            params.insert(params.end(), p.begin(), p.end());
        }
        return params;
    }

    torch::Tensor LayerStack::regularization_loss() const {
        std::optional<torch::Tensor> total;
        for (const auto& layer : layers_) {
            const auto* conv = dynamic_cast<const ICubeConvolution*>(layer.get());
            if (!conv || !conv->is_built())
                continue;
            auto loss = conv->regularization_loss();
            total = total ? *total + loss : loss;
        }
        return total ? *total : torch::scalar_tensor(0.0, torch::kFloat32);
    }

    void LayerStack::apply_constraints() {
        for (auto& layer : layers_) {
            if (auto* conv = dynamic_cast<ICubeConvolution*>(layer.get())) {
                conv->apply_constraints();
            }
        }
    }

    nlohmann::json LayerStack::to_json() const {
        nlohmann::json j;
        j["version"] = STACK_JSON_VERSION;
        j["layers"] = nlohmann::json::array();
        for (const auto& layer : layers_) {
            j["layers"].push_back({
                {"class_name", std::string(layer->class_name())},
                {"config", layer->get_config()}
            });
        }
        return j;
    }

    std::expected<LayerStack, std::string> LayerStack::from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("layers") || !j["layers"].is_array()) {
            return std::unexpected("Invalid argument: stack record must contain a 'layers' array");
        }
        const int version = j.value("version", STACK_JSON_VERSION);
        if (version > STACK_JSON_VERSION) {
            return std::unexpected(std::format("Invalid argument: unsupported stack version {}", version));
        }

        LayerStack stack;
        for (size_t i = 0; i < j["layers"].size(); ++i) {
            auto layer = layer_from_json(j["layers"][i]);
            if (!layer) {
                return std::unexpected(std::format("layer {}: {}", i, layer.error()));
            }
            stack.add(std::move(*layer));
        }
        return stack;
    }

    bool LayerStack::save_to_json(const std::string& path) const {
        try {
            const auto j = to_json();

            std::ofstream file(path);
            if (!file.is_open()) {
                LOG_ERROR("Failed to open layer stack file: {}", path);
                return false;
            }
            file << j.dump(2);
            LOG_INFO("Saved {} layers to {}", layers_.size(), path);
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("Layer stack save failed: {}", e.what());
            return false;
        }
    }

    bool LayerStack::load_from_json(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                LOG_ERROR("Failed to open layer stack file: {}", path);
                return false;
            }

            const auto j = nlohmann::json::parse(file);
            auto stack = from_json(j);
            if (!stack) {
                LOG_ERROR("Layer stack load failed: {}", stack.error());
                return false;
            }
            layers_ = std::move(stack->layers_);
            LOG_INFO("Loaded {} layers from {}", layers_.size(), path);
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("Layer stack load failed: {}", e.what());
            return false;
        }
    }

} // namespace csn::layers
