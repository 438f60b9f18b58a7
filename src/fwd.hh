// SPDX-License-Identifier: MIT
#pragma once

class Visualizer;
class AnimatorManager;
class Tween;
struct MainRenderPass;
struct RevealRenderer;

namespace Topology {
    struct Instance;
}

namespace MeshSource {
    struct MeshData;
}

namespace Stage {
    class Batch;
    class Controller;
}

namespace Dissolve {
    class Surface;
    class Assembler;
}

namespace Reveal {
    class Backend;
    struct Settings;
    class System;
}

namespace Lighting {
    struct Uniforms;
    struct Settings;
}
