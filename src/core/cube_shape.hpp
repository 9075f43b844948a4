/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <torch/torch.h>

namespace csn::core {

    inline constexpr int64_t NUM_FACES = 6;
    inline constexpr int64_t CUBE_RANK = 5;

    // Axes of a (batch, channels, height, width, face) tensor
    inline constexpr int64_t BATCH_AXIS = 0;
    inline constexpr int64_t CHANNEL_AXIS = 1;
    inline constexpr int64_t HEIGHT_AXIS = 2;
    inline constexpr int64_t WIDTH_AXIS = 3;
    inline constexpr int64_t FACE_AXIS = 4;

    enum class DataFormat : uint8_t {
        ChannelsFirst,
        ChannelsLast
    };

    std::expected<DataFormat, std::string> parse_data_format(std::string_view name);
    std::string_view to_string(DataFormat format);

    // Symbolic shape for graph-time inference. std::nullopt is an unknown dimension.
    using Shape = std::vector<std::optional<int64_t>>;

    Shape shape_of(const torch::Tensor& tensor);
    std::string format_shape(const Shape& shape);

    struct CubeDims {
        int64_t batch;
        int64_t channels;
        int64_t height;
        int64_t width;
    };

    /**
     * @brief Check that a tensor is a channels-first cube-sphere tensor
     * @param tensor [B, C, H, W, 6]
     * @return The four leading dimensions, or an error describing the mismatch
     */
    std::expected<CubeDims, std::string> validate_cube_tensor(const torch::Tensor& tensor);

    // Same checks on a symbolic shape. Unknown dimensions pass.
    std::expected<void, std::string> validate_cube_shape(const Shape& shape);

    /**
     * @brief Assemble six per-face tensors into one cube-sphere tensor
     * @param faces Six [B, C, H, W] tensors in face order 0-5
     * @return [B, C, H, W, 6] or an error if the faces disagree in shape, dtype or device
     */
    std::expected<torch::Tensor, std::string> stack_faces(const std::vector<torch::Tensor>& faces);

    // Views of the six faces, each [B, C, H, W]
    std::vector<torch::Tensor> unstack_faces(const torch::Tensor& cube);

} // namespace csn::core
