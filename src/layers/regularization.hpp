/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "config/layer_config.hpp"
#include <torch/torch.h>

namespace csn::layers {

    /**
     * @brief l1 * sum(|w|) + l2 * sum(w^2), a scalar tensor on w's device
     *
     * Differentiable; add it to the training loss.
     */
    torch::Tensor regularization_penalty(const torch::Tensor& w, const config::RegularizerSpec& spec);

    /**
     * @brief Project `w` onto the constraint set in place, without recording autograd history
     *
     * Norm axes are wrapped into range for w's rank, so the default (0, 1, 2) on a
     * 1-D bias reduces over its single axis.
     */
    void apply_constraint(torch::Tensor& w, const config::ConstraintSpec& spec);

} // namespace csn::layers
