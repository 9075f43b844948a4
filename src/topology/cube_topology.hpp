/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <array>
#include <cstdint>
#include <string_view>

/**
 * @file cube_topology.hpp
 * @brief Edge adjacency of the six cube-sphere faces
 *
 * Face storage convention (N = face size, cell centres on the cube [0, N]^3):
 *
 *   face 0  y = 0   row -> +z   col -> +x
 *   face 1  x = N   row -> +z   col -> +y
 *   face 2  y = N   row -> +z   col -> -x
 *   face 3  x = 0   row -> +z   col -> -y
 *   face 4  z = 0   row -> -y   col -> +x   (south pole)
 *   face 5  z = N   row -> +y   col -> +x   (north pole)
 *
 * Top is row 0, Left is column 0. Every halo strip is described in an
 * edge-local frame: depth k counts cells away from the edge, the along index
 * runs with the face's column (Top/Bottom) or row (Left/Right) index.
 */

namespace csn::topology {

    inline constexpr int NUM_FACES = 6;
    inline constexpr int NUM_EDGES = 4;
    inline constexpr int SOUTH_POLE = 4;
    inline constexpr int NORTH_POLE = 5;

    enum class Edge : uint8_t {
        Top = 0,
        Bottom = 1,
        Left = 2,
        Right = 3
    };

    inline constexpr std::array<Edge, NUM_EDGES> ALL_EDGES{Edge::Top, Edge::Bottom, Edge::Left, Edge::Right};

    // Reorientation of a neighbour's boundary strip into the requesting face's frame.
    // Transpose: a row edge meets a column edge. Reverse: along indices run opposite ways.
    enum class Transform : uint8_t {
        Identity = 0,
        Reverse = 1,
        Transpose = 2,
        TransposeReverse = 3
    };

    enum class FaceGroup : uint8_t {
        Equatorial,
        SouthPole,
        NorthPole
    };

    struct AdjacencyEntry {
        int face;
        Edge edge;
        Transform transform;
    };

    [[nodiscard]] constexpr bool is_row_edge(const Edge edge) {
        return edge == Edge::Top || edge == Edge::Bottom;
    }

    [[nodiscard]] constexpr bool is_transposed(const Transform t) {
        return t == Transform::Transpose || t == Transform::TransposeReverse;
    }

    [[nodiscard]] constexpr bool is_reversed(const Transform t) {
        return t == Transform::Reverse || t == Transform::TransposeReverse;
    }

    // Both components are involutions in the edge-local frame.
    [[nodiscard]] constexpr Transform inverse(const Transform t) {
        return t;
    }

    /**
     * @brief Neighbour supplying the halo beyond `edge` of `face`
     * @throws std::out_of_range if face is not in [0, 6)
     */
    [[nodiscard]] const AdjacencyEntry& neighbor(int face, Edge edge);

    /**
     * @throws std::out_of_range if face is not in [0, 6)
     */
    [[nodiscard]] FaceGroup face_group(int face);

    [[nodiscard]] std::string_view to_string(Edge edge);
    [[nodiscard]] std::string_view to_string(Transform transform);
    [[nodiscard]] std::string_view to_string(FaceGroup group);

} // namespace csn::topology
