/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "cube_halo_padder.hpp"
#include "core/logger.hpp"
#include "topology/cube_topology.hpp"
#include <algorithm>
#include <array>
#include <format>
#include <stdexcept>

namespace csn::layers {

    using topology::Edge;

    namespace {
        // Per-face tensors are [B, C, H, W]; strips are [B, C, depth, along]
        constexpr int64_t H = 2;
        constexpr int64_t W = 3;

        using Faces = std::array<torch::Tensor, topology::NUM_FACES>;

        /**
         * Boundary strip of `face` inside `edge`, skipping `offset` halo cells
         * already present along the edge normal. Depth 0 is the cell at the edge.
         */
        torch::Tensor read_edge(const torch::Tensor& face, const Edge edge, const int64_t depth, const int64_t offset) {
            switch (edge) {
            case Edge::Top:
                return face.slice(H, offset, offset + depth);
            case Edge::Bottom: {
                const auto end = face.size(H) - offset;
                return face.slice(H, end - depth, end).flip({H});
            }
            case Edge::Left:
                return face.slice(W, offset, offset + depth).transpose(H, W);
            case Edge::Right: {
                const auto end = face.size(W) - offset;
                return face.slice(W, end - depth, end).flip({W}).transpose(H, W);
            }
            }
            throw std::logic_error("unreachable edge");
        }

        // Lay an edge-local strip out as the halo block beyond `edge`
        torch::Tensor place_halo(const torch::Tensor& strip, const Edge edge) {
            switch (edge) {
            case Edge::Top: return strip.flip({H});
            case Edge::Bottom: return strip;
            case Edge::Left: return strip.flip({H}).transpose(H, W);
            case Edge::Right: return strip.transpose(H, W);
            }
            throw std::logic_error("unreachable edge");
        }

        /**
         * Halo beyond `edge` of `face`, read from the neighbour's tensor in `source`.
         * `offset(e)` is the halo width already present in the source along the normal of e.
         */
        template <typename OffsetFn>
        torch::Tensor fetch_halo(const Faces& source, const int face, const Edge edge,
                                 const int64_t p, OffsetFn offset) {
            const auto& n = topology::neighbor(face, edge);
            const auto& src = source[static_cast<size_t>(n.face)];
            if (!src.defined()) {
                throw std::logic_error(std::format("face {} needs face {} before it is padded", face, n.face));
            }
            auto strip = read_edge(src, n.edge, p, offset(n.edge));
            if (topology::is_reversed(n.transform)) {
                strip = strip.flip({W});
            }
            return place_halo(strip, edge);
        }
    } // namespace

    std::expected<CubeHaloPadder, std::string> CubeHaloPadder::create(const config::PadderConfig& config) {
        if (config.data_format != core::DataFormat::ChannelsFirst) {
            return std::unexpected(std::format(
                "Invalid argument: {} supports only channels_first data, got {}",
                CLASS_NAME, core::to_string(config.data_format)));
        }
        if (config.padding < 0) {
            return std::unexpected(std::format("Invalid argument: halo width must be >= 0, got {}", config.padding));
        }
        LOG_DEBUG("Created {} '{}' with halo width {}", CLASS_NAME, config.name, config.padding);
        return CubeHaloPadder(config);
    }

    std::expected<torch::Tensor, std::string> CubeHaloPadder::pad(const torch::Tensor& input, const int64_t p) {
        auto dims = core::validate_cube_tensor(input);
        if (!dims) {
            return std::unexpected(dims.error());
        }
        if (dims->height != dims->width) {
            return std::unexpected(std::format(
                "Invalid argument: cube faces must be square, got {}x{}", dims->height, dims->width));
        }
        if (p < 0 || p > std::min(dims->height, dims->width)) {
            return std::unexpected(std::format(
                "Invalid argument: halo width {} outside [0, {}]", p, std::min(dims->height, dims->width)));
        }
        if (p == 0) {
            return input;
        }

        try {
            LOG_TIMER_TRACE("CubeHaloPadder::pad");

            Faces raw;
            for (int f = 0; f < topology::NUM_FACES; ++f) {
                raw[f] = input.select(core::FACE_AXIS, f);
            }

            // Pass 1: height halo from the raw Top/Bottom neighbours
            Faces rows;
            const auto no_halo = [](Edge) -> int64_t { return 0; };
            for (int f = 0; f < topology::NUM_FACES; ++f) {
                rows[f] = torch::cat({fetch_halo(raw, f, Edge::Top, p, no_halo),
                                      raw[f],
                                      fetch_halo(raw, f, Edge::Bottom, p, no_halo)},
                                     H);
            }

            // Pass 2: width halo. Neighbours reached through a column edge are read from
            // their height-padded tensor; through a row edge from their finished tensor,
            // which exists because every such neighbour is an equatorial face (0-3).
            Faces full;
            const auto halo_of = [p](Edge e) -> int64_t { return topology::is_row_edge(e) ? p : 0; };
            for (int f = 0; f < topology::NUM_FACES; ++f) {
                std::array<torch::Tensor, 2> sides;
                for (const auto edge : {Edge::Left, Edge::Right}) {
                    const auto& n = topology::neighbor(f, edge);
                    const auto& source = topology::is_row_edge(n.edge) ? full : rows;
                    sides[edge == Edge::Left ? 0 : 1] = fetch_halo(source, f, edge, p, halo_of);
                }
                full[f] = torch::cat({sides[0], rows[f], sides[1]}, W);
            }

            return torch::stack(full, core::FACE_AXIS);
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Error padding cube-sphere tensor: {}", e.what()));
        }
    }

    std::expected<torch::Tensor, std::string> CubeHaloPadder::forward(const torch::Tensor& input) {
        return pad(input, config_.padding);
    }

    std::expected<core::Shape, std::string> CubeHaloPadder::compute_output_shape(const core::Shape& input_shape) const {
        if (auto valid = core::validate_cube_shape(input_shape); !valid) {
            return std::unexpected(valid.error());
        }
        const auto& h = input_shape[core::HEIGHT_AXIS];
        const auto& w = input_shape[core::WIDTH_AXIS];
        if (h && w && *h != *w) {
            return std::unexpected(std::format("Invalid argument: cube faces must be square, got {}x{}", *h, *w));
        }
        for (const auto& dim : {h, w}) {
            if (dim && config_.padding > *dim) {
                return std::unexpected(std::format(
                    "Invalid argument: halo width {} exceeds face size {}", config_.padding, *dim));
            }
        }

        core::Shape out = input_shape;
        for (const auto axis : {core::HEIGHT_AXIS, core::WIDTH_AXIS}) {
            if (out[axis])
                *out[axis] += 2 * config_.padding;
        }
        return out;
    }

    nlohmann::json CubeHaloPadder::get_config() const {
        return config::to_json(config_);
    }

} // namespace csn::layers
