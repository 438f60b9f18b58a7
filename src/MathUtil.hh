// SPDX-License-Identifier: MIT
#pragma once
#include <cstdint>
#include <typed-geometry/tg.hh>

namespace Util {

inline float srgb2linear(uint8_t value) {
    return value <= 10
        ? value * (25.f / 323 / 255)
        : tg::pow(((200.f / 211 / 255) * value + (11.f / 211)), 2.4f);
}

/// 0xRRGGBB in sRGB to a linear color
inline tg::color3 unpackSRGB(uint32_t value) {
    return tg::color3(
        srgb2linear((value >> 16) & 0xFF),
        srgb2linear((value >> 8) & 0xFF),
        srgb2linear((value >> 0) & 0xFF)
    );
}

/// not normalized: the length is twice the triangle area, which makes it
/// usable as an area weight when accumulating vertex normals
inline tg::vec3 triangleAreaNormal(tg::pos3 p1, tg::pos3 p2, tg::pos3 p3) {
    return tg::cross(p2 - p1, p3 - p1);
}

inline tg::vec3 triangleNormal(tg::pos3 p1, tg::pos3 p2, tg::pos3 p3) {
    return tg::normalize_safe(triangleAreaNormal(p1, p2, p3));
}

/// Keeps the rotation of `view`, replaces its translation with a fixed camera space position.
/// Geometry drawn with it stays at `offset` on screen and turns with the world.
inline tg::mat4 cameraAnchored(tg::mat4 view, tg::vec3 offset) {
    view[3] = tg::vec4(offset.x, offset.y, offset.z, 1);
    return view;
}

}
