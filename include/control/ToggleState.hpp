#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Well-known controllable ids
namespace controllable {
inline const std::string kRecording    = "recording";
inline const std::string kMonitorLevel = "monitor_level";   // false = low, true = high
inline const std::string kFxMute       = "fx_mute";
inline const std::string kBreakMode    = "break_mode";
}  // namespace controllable

// Local notion of each controllable's two-valued state.
// Tracks operator intent, not confirmed console state (there is no read-back).
// Owned by the OperationDispatcher; every access takes mtx_.
class ToggleState {
public:
    ToggleState() { reset(); }

    explicit ToggleState(const std::vector<std::string>& ids) : ids_(ids) {
        reset();
    }

    // Back to defaults: everything off / low / inactive
    void reset() {
        std::lock_guard lock(mtx_);
        values_.clear();
        for (auto& id : defaultIds())
            values_[id] = false;
        for (auto& id : ids_)
            values_[id] = false;
    }

    // Unknown ids read as off
    bool get(const std::string& id) const {
        std::lock_guard lock(mtx_);
        auto it = values_.find(id);
        return it != values_.end() && it->second;
    }

    void set(const std::string& id, bool value) {
        std::lock_guard lock(mtx_);
        values_[id] = value;
    }

    // Flips the value and returns the new one
    bool toggle(const std::string& id) {
        std::lock_guard lock(mtx_);
        bool& v = values_[id];
        v = !v;
        return v;
    }

    std::map<std::string, bool> snapshot() const {
        std::lock_guard lock(mtx_);
        return values_;
    }

private:
    static const std::vector<std::string>& defaultIds() {
        static const std::vector<std::string> ids = {
            controllable::kRecording,
            controllable::kMonitorLevel,
            controllable::kFxMute,
            controllable::kBreakMode
        };
        return ids;
    }

    std::vector<std::string>    ids_;
    std::map<std::string, bool> values_;
    mutable std::mutex          mtx_;
};
