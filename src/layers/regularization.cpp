/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "regularization.hpp"
#include <algorithm>
#include <vector>

namespace csn::layers {

    namespace {
        constexpr double NORM_EPSILON = 1e-7;

        std::vector<int64_t> wrap_axes(const std::vector<int64_t>& axes, const int64_t rank) {
            std::vector<int64_t> out;
            for (const auto axis : axes) {
                const auto wrapped = ((axis % rank) + rank) % rank;
                if (std::find(out.begin(), out.end(), wrapped) == out.end()) {
                    out.push_back(wrapped);
                }
            }
            return out;
        }
    } // namespace

    torch::Tensor regularization_penalty(const torch::Tensor& w, const config::RegularizerSpec& spec) {
        auto penalty = torch::scalar_tensor(0.0, w.options());
        if (spec.l1 > 0.0) {
            penalty = penalty + spec.l1 * w.abs().sum();
        }
        if (spec.l2 > 0.0) {
            penalty = penalty + spec.l2 * w.square().sum();
        }
        return penalty;
    }

    void apply_constraint(torch::Tensor& w, const config::ConstraintSpec& spec) {
        torch::NoGradGuard no_grad;

        using Kind = config::ConstraintSpec::Kind;
        if (spec.kind == Kind::NonNeg) {
            w.clamp_min_(0.0);
            return;
        }

        const auto axes = wrap_axes(spec.axis, w.dim());
        const auto norms = w.square().sum(axes, /*keepdim=*/true).sqrt();
        if (spec.kind == Kind::MaxNorm) {
            const auto desired = norms.clamp(0.0, spec.max_value);
            w.mul_(desired / (norms + NORM_EPSILON));
        } else {
            w.div_(norms + NORM_EPSILON);
        }
    }

} // namespace csn::layers
