#pragma once

namespace filebase {

// Dirty flag: set by any mutation, cleared only by a successful save.
// Not synchronized, the owning FileHandle guards it with its own mutex.
class ChangeTracker {
public:
    void mark_dirty() { _dirty = true; }
    void mark_clean() { _dirty = false; }
    [[nodiscard]] bool is_dirty() const { return _dirty; }

private:
    bool _dirty = false;
};

} // namespace filebase
