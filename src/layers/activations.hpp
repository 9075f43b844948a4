/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "config/layer_config.hpp"
#include <torch/torch.h>

namespace csn::layers {

    // Elementwise, differentiable through libtorch autograd
    torch::Tensor apply_activation(const torch::Tensor& x, config::Activation activation);

} // namespace csn::layers
