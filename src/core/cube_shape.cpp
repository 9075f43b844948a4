/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "cube_shape.hpp"
#include <format>

namespace csn::core {

    std::expected<DataFormat, std::string> parse_data_format(std::string_view name) {
        if (name == "channels_first")
            return DataFormat::ChannelsFirst;
        if (name == "channels_last")
            return DataFormat::ChannelsLast;
        return std::unexpected(std::format("Unknown data format '{}'", name));
    }

    std::string_view to_string(const DataFormat format) {
        return format == DataFormat::ChannelsFirst ? "channels_first" : "channels_last";
    }

    Shape shape_of(const torch::Tensor& tensor) {
        Shape shape;
        shape.reserve(static_cast<size_t>(tensor.dim()));
        for (const auto size : tensor.sizes()) {
            shape.emplace_back(size);
        }
        return shape;
    }

    std::string format_shape(const Shape& shape) {
        std::string out = "(";
        for (size_t i = 0; i < shape.size(); ++i) {
            if (i > 0)
                out += ", ";
            out += shape[i] ? std::to_string(*shape[i]) : "None";
        }
        out += ")";
        return out;
    }

    std::expected<CubeDims, std::string> validate_cube_tensor(const torch::Tensor& tensor) {
        if (!tensor.defined()) {
            return std::unexpected("Invalid argument: undefined tensor");
        }
        if (auto valid = validate_cube_shape(shape_of(tensor)); !valid) {
            return std::unexpected(valid.error());
        }
        return CubeDims{
            .batch = tensor.size(BATCH_AXIS),
            .channels = tensor.size(CHANNEL_AXIS),
            .height = tensor.size(HEIGHT_AXIS),
            .width = tensor.size(WIDTH_AXIS)};
    }

    std::expected<void, std::string> validate_cube_shape(const Shape& shape) {
        if (static_cast<int64_t>(shape.size()) != CUBE_RANK) {
            return std::unexpected(std::format(
                "Invalid argument: expected a 5-D (batch, channels, height, width, 6) tensor, got shape {}",
                format_shape(shape)));
        }
        if (shape[FACE_AXIS] && *shape[FACE_AXIS] != NUM_FACES) {
            return std::unexpected(std::format(
                "Invalid argument: last dimension must hold the {} cube faces, got shape {}",
                NUM_FACES, format_shape(shape)));
        }
        return {};
    }

    std::expected<torch::Tensor, std::string> stack_faces(const std::vector<torch::Tensor>& faces) {
        if (static_cast<int64_t>(faces.size()) != NUM_FACES) {
            return std::unexpected(std::format(
                "Invalid argument: expected {} faces, got {}", NUM_FACES, faces.size()));
        }
        for (size_t f = 0; f < faces.size(); ++f) {
            if (!faces[f].defined() || faces[f].dim() != 4) {
                return std::unexpected(std::format(
                    "Invalid argument: face {} must be a 4-D (batch, channels, height, width) tensor", f));
            }
            if (faces[f].sizes() != faces[0].sizes()) {
                return std::unexpected(std::format(
                    "Invalid argument: face {} has shape {} but face 0 has shape {}",
                    f, format_shape(shape_of(faces[f])), format_shape(shape_of(faces[0]))));
            }
            if (faces[f].scalar_type() != faces[0].scalar_type() || faces[f].device() != faces[0].device()) {
                return std::unexpected(std::format(
                    "Invalid argument: face {} differs from face 0 in dtype or device", f));
            }
        }
        return torch::stack(faces, FACE_AXIS);
    }

    std::vector<torch::Tensor> unstack_faces(const torch::Tensor& cube) {
        return cube.unbind(FACE_AXIS);
    }

} // namespace csn::core
