/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "config/layer_config.hpp"
#include <utility>
#include <torch/torch.h>

namespace csn::layers {

    /**
     * @brief Fan-in / fan-out of a weight shape
     *
     * (kH, kW, in, out) kernels use receptive field * in and receptive field * out,
     * 1-D shapes use their length for both.
     */
    std::pair<double, double> compute_fans(torch::IntArrayRef shape);

    /**
     * @brief Allocate a float32 tensor of `shape` filled per `spec`, outside autograd
     * @note The result does not require grad; the caller marks it as a parameter.
     */
    torch::Tensor initialize(const config::InitializerSpec& spec, torch::IntArrayRef shape,
                             const torch::TensorOptions& options = torch::TensorOptions().dtype(torch::kFloat32));

} // namespace csn::layers
