#include "board/history/history_manager.h"

#include "board/core/logging.h"
#include "board/entity/element_store.h"
#include "board/sync/sync_session.h"

#include <utility>

namespace board {

HistoryManager::HistoryManager(ElementStore& store, SyncSession& sync)
    : store_(store), sync_(sync) {}

void HistoryManager::clear() {
    history_.clear();
    cursor_ = 0;
    historyGeneration_++;
}

bool HistoryManager::canUndo() const noexcept {
    return cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return cursor_ < history_.size();
}

void HistoryManager::record(HistoryItem item) {
    if (item.kind == HistoryKind::Update && item.next.empty()) return;
    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    history_.push_back(std::move(item));
    cursor_ = history_.size();
    historyGeneration_++;
}

bool HistoryManager::undo() {
    if (!canUndo()) return false;
    --cursor_;
    applyItem(history_[cursor_], false);
    historyGeneration_++;
    return true;
}

bool HistoryManager::redo() {
    if (!canRedo()) return false;
    applyItem(history_[cursor_], true);
    ++cursor_;
    historyGeneration_++;
    return true;
}

void HistoryManager::applyItem(const HistoryItem& item, bool forward) {
    // create forward / delete backward: element comes back
    const bool revive = (item.kind == HistoryKind::Create) == forward;

    switch (item.kind) {
        case HistoryKind::Create:
        case HistoryKind::Delete: {
            if (revive) {
                if (!store_.restore(item.id)) {
                    BOARD_LOG_DEBUG("history: %s has no tombstone to restore", item.id.c_str());
                }
                ElementPatch patch;
                patch.deleted = false;
                sync_.persistUpdate(item.id, patch);
            } else {
                if (!store_.softDelete(item.id)) {
                    BOARD_LOG_DEBUG("history: %s is not live", item.id.c_str());
                }
                sync_.persistDelete(item.id);
            }
            break;
        }
        case HistoryKind::Update:
            writePatch(item.id, forward ? item.next : item.previous);
            break;
    }
}

void HistoryManager::writePatch(const std::string& id, const ElementPatch& patch) {
    ElementPtr base = store_.find(id);
    if (!base) base = store_.findTombstone(id);
    if (!base) {
        BOARD_LOG_WARN("history: update target %s is unknown", id.c_str());
        return;
    }
    store_.upsert(makeElement(applyPatch(*base, patch)));
    sync_.persistUpdate(id, patch);
}

} // namespace board
