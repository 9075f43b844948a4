/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "initializers.hpp"
#include <cmath>

namespace csn::layers {

    using Kind = config::InitializerSpec::Kind;

    std::pair<double, double> compute_fans(torch::IntArrayRef shape) {
        if (shape.empty()) {
            return {1.0, 1.0};
        }
        if (shape.size() == 1) {
            return {static_cast<double>(shape[0]), static_cast<double>(shape[0])};
        }
        if (shape.size() == 2) {
            return {static_cast<double>(shape[0]), static_cast<double>(shape[1])};
        }
        // Channels are the last two axes: (..., in, out)
        double receptive_field = 1.0;
        for (size_t i = 0; i + 2 < shape.size(); ++i) {
            receptive_field *= static_cast<double>(shape[i]);
        }
        const auto in = static_cast<double>(shape[shape.size() - 2]);
        const auto out = static_cast<double>(shape[shape.size() - 1]);
        return {receptive_field * in, receptive_field * out};
    }

    torch::Tensor initialize(const config::InitializerSpec& spec, torch::IntArrayRef shape,
                             const torch::TensorOptions& options) {
        torch::NoGradGuard no_grad;

        const auto [fan_in, fan_out] = compute_fans(shape);
        auto t = torch::empty(shape, options);

        switch (spec.kind) {
        case Kind::Zeros: return t.zero_();
        case Kind::Ones: return t.fill_(1.0);
        case Kind::Constant: return t.fill_(spec.value);
        case Kind::RandomUniform: return t.uniform_(spec.minval, spec.maxval);
        case Kind::RandomNormal: return t.normal_(spec.mean, spec.stddev);
        case Kind::GlorotUniform: {
            const double limit = std::sqrt(6.0 / (fan_in + fan_out));
            return t.uniform_(-limit, limit);
        }
        case Kind::GlorotNormal: return t.normal_(0.0, std::sqrt(2.0 / (fan_in + fan_out)));
        case Kind::HeUniform: {
            const double limit = std::sqrt(6.0 / fan_in);
            return t.uniform_(-limit, limit);
        }
        case Kind::HeNormal: return t.normal_(0.0, std::sqrt(2.0 / fan_in));
        case Kind::LecunUniform: {
            const double limit = std::sqrt(3.0 / fan_in);
            return t.uniform_(-limit, limit);
        }
        case Kind::LecunNormal: return t.normal_(0.0, std::sqrt(1.0 / fan_in));
        }
        return t.zero_();
    }

} // namespace csn::layers
