#pragma once

namespace camwatch {

enum class LivenessStatus {
    Unknown,
    Up,
    Down
};

enum class AddResult {
    Added,
    AlreadyPresent,
    StorageError
};

enum class RemoveResult {
    Removed,
    NotPresent,
    StorageError
};

enum class SchedulerState {
    Stopped,
    Running,
    Stopping
};

} // namespace camwatch
