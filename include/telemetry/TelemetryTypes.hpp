#pragma once

namespace Loom::Core {

// Poll buffer lifecycle, as seen by telemetry readers
enum class BufferState {
    RUNNING,
    DRAINING, // shutdown notified, pollers still exiting
    STOPPED   // every poller joined
};

const char* bufferStateName(BufferState state);

} // namespace Loom::Core
