// Hover indicator for the drop target, derived from drag notifications.
#pragma once

namespace ncmdump {

enum class DragEvent {
    HoverStart,    // a drag entered the drop target
    Drop,          // files were released over the target
    Cancelled,     // the drag left the target or was aborted
    DropCompleted  // ingestion of a drop finished
};

// Pure reducer: only HoverStart turns the indicator on.
inline bool reduceDragState(bool /*current*/, DragEvent ev) {
    switch (ev) {
    case DragEvent::HoverStart:
        return true;
    case DragEvent::Drop:
    case DragEvent::Cancelled:
    case DragEvent::DropCompleted:
        return false;
    }
    return false;
}

inline const char *dragEventName(DragEvent ev) {
    switch (ev) {
    case DragEvent::HoverStart:
        return "HoverStart";
    case DragEvent::Drop:
        return "Drop";
    case DragEvent::Cancelled:
        return "Cancelled";
    case DragEvent::DropCompleted:
        return "DropCompleted";
    }
    return "Unknown";
}

} // namespace ncmdump
