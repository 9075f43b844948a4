/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "activations.hpp"

namespace csn::layers {

    using config::Activation;

    torch::Tensor apply_activation(const torch::Tensor& x, const Activation activation) {
        switch (activation) {
        case Activation::Linear: return x;
        case Activation::Relu: return torch::relu(x);
        case Activation::Tanh: return torch::tanh(x);
        case Activation::Sigmoid: return torch::sigmoid(x);
        // clip(0.2 x + 0.5, 0, 1)
        case Activation::HardSigmoid: return torch::clamp(0.2 * x + 0.5, 0.0, 1.0);
        case Activation::Elu: return torch::elu(x);
        case Activation::Selu: return torch::selu(x);
        case Activation::Softplus: return torch::softplus(x);
        case Activation::Softsign: return x / (1.0 + x.abs());
        case Activation::Exponential: return torch::exp(x);
        }
        return x;
    }

} // namespace csn::layers
