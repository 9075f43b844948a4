/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "cube_topology.hpp"
#include <format>
#include <stdexcept>

namespace csn::topology {

    namespace {
        using Row = std::array<AdjacencyEntry, NUM_EDGES>;

        constexpr auto T = Edge::Top;
        constexpr auto B = Edge::Bottom;
        constexpr auto L = Edge::Left;
        constexpr auto R = Edge::Right;

        constexpr auto ID = Transform::Identity;
        constexpr auto REV = Transform::Reverse;
        constexpr auto TR = Transform::Transpose;
        constexpr auto TR_REV = Transform::TransposeReverse;

        // Indexed [face][edge] in Top, Bottom, Left, Right order
        constexpr std::array<Row, NUM_FACES> ADJACENCY{{
            //     top               bottom            left               right
            Row{{{4, B, ID}, {5, T, ID}, {3, R, ID}, {1, L, ID}}},
            Row{{{4, R, TR_REV}, {5, R, TR}, {0, R, ID}, {2, L, ID}}},
            Row{{{4, T, REV}, {5, B, REV}, {1, R, ID}, {3, L, ID}}},
            Row{{{4, L, TR}, {5, L, TR_REV}, {2, R, ID}, {0, L, ID}}},
            Row{{{2, T, REV}, {0, T, ID}, {3, T, TR}, {1, T, TR_REV}}},
            Row{{{0, B, ID}, {2, B, REV}, {3, B, TR_REV}, {1, B, TR}}},
        }};

        constexpr bool adjacency_is_consistent() {
            for (int f = 0; f < NUM_FACES; ++f) {
                for (const auto e : ALL_EDGES) {
                    const auto& n = ADJACENCY[f][static_cast<size_t>(e)];
                    if (n.face == f || n.face < 0 || n.face >= NUM_FACES)
                        return false;
                    if (is_transposed(n.transform) == (is_row_edge(e) == is_row_edge(n.edge)))
                        return false;
                    const auto& back = ADJACENCY[n.face][static_cast<size_t>(n.edge)];
                    if (back.face != f || back.edge != e || back.transform != inverse(n.transform))
                        return false;
                }
            }
            return true;
        }

        static_assert(adjacency_is_consistent(), "cube adjacency table is not symmetric");

        void check_face(const int face) {
            if (face < 0 || face >= NUM_FACES) {
                throw std::out_of_range(std::format("Face index {} out of range [0, {})", face, NUM_FACES));
            }
        }
    } // namespace

    const AdjacencyEntry& neighbor(const int face, const Edge edge) {
        check_face(face);
        return ADJACENCY[static_cast<size_t>(face)][static_cast<size_t>(edge)];
    }

    FaceGroup face_group(const int face) {
        check_face(face);
        switch (face) {
        case SOUTH_POLE: return FaceGroup::SouthPole;
        case NORTH_POLE: return FaceGroup::NorthPole;
        default: return FaceGroup::Equatorial;
        }
    }

    std::string_view to_string(const Edge edge) {
        switch (edge) {
        case Edge::Top: return "top";
        case Edge::Bottom: return "bottom";
        case Edge::Left: return "left";
        case Edge::Right: return "right";
        }
        return "unknown";
    }

    std::string_view to_string(const Transform transform) {
        switch (transform) {
        case Transform::Identity: return "identity";
        case Transform::Reverse: return "reverse";
        case Transform::Transpose: return "transpose";
        case Transform::TransposeReverse: return "transpose-reverse";
        }
        return "unknown";
    }

    std::string_view to_string(const FaceGroup group) {
        switch (group) {
        case FaceGroup::Equatorial: return "equatorial";
        case FaceGroup::SouthPole: return "south_pole";
        case FaceGroup::NorthPole: return "north_pole";
        }
        return "unknown";
    }

} // namespace csn::topology
