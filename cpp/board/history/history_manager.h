#pragma once

#include "board/history/history_types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace board {

class ElementStore;
class SyncSession;

/**
 * Local undo/redo log. Items before the cursor have been applied; undo walks
 * the cursor back applying inverses, redo walks it forward. Every replay is
 * written to the store and sent to persistence like a fresh local edit.
 */
class HistoryManager {
public:
    HistoryManager(ElementStore& store, SyncSession& sync);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Drops any redo tail, appends, and moves the cursor past the new item.
    void record(HistoryItem item);

    bool undo();
    bool redo();

    void clear();
    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }

private:
    void applyItem(const HistoryItem& item, bool forward);
    void writePatch(const std::string& id, const ElementPatch& patch);

    ElementStore& store_;
    SyncSession& sync_;

    std::vector<HistoryItem> history_;
    std::size_t cursor_ = 0;
    std::uint32_t historyGeneration_ = 0;
};

} // namespace board
