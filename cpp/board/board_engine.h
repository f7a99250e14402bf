#pragma once

#include "board/core/config.h"
#include "board/core/element.h"
#include "board/core/id_generator.h"
#include "board/core/types.h"
#include "board/entity/element_store.h"
#include "board/history/history_manager.h"
#include "board/interaction/interaction_session.h"
#include "board/sync/sync_session.h"
#include "board/sync/sync_types.h"
#include "board/sync/thumbnail_scheduler.h"
#include "board/text/font_manager.h"
#include "board/text/font_text_measurer.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace board {

struct DisplayProfile {
    std::string displayName;
    std::string avatarUrl;
    std::string color;
};

struct MountOptions {
    std::string spaceId;
    std::string userId;
    std::optional<DisplayProfile> profile;
    bool canEdit = true;
};

/**
 * BoardEngine: the single mount point exposed to the page shell.
 *
 * Owns the element store, history, sync session and interaction session for
 * one collaborative space and wires their callbacks together. The shell
 * forwards input events, calls tick() from its frame loop, and reads
 * elements(), camera(), selection and presence for rendering.
 */
class BoardEngine {
public:
    BoardEngine(ElementRepository& repository, RealtimeChannel& channel, BoardConfig config = {});
    ~BoardEngine();

    BoardEngine(const BoardEngine&) = delete;
    BoardEngine& operator=(const BoardEngine&) = delete;

    // ==============================================================================
    // Lifecycle
    // ==============================================================================
    bool mount(const MountOptions& options);
    void leave();
    bool mounted() const noexcept { return mounted_; }
    bool canEdit() const noexcept { return session_.canEdit(); }

    void setThumbnailServices(ThumbnailRenderer* renderer, ThumbnailUploader* uploader);
    // Drives the cursor-broadcast trailing edge and the thumbnail debounce.
    void tick(double nowMs);

    // Registers a font face for text measurement; returns 0 on failure.
    std::uint32_t loadFont(const std::uint8_t* data, std::size_t size, const std::string& family);

    // ==============================================================================
    // Input
    // ==============================================================================
    void pointerDown(PointerEvent ev);
    void pointerMove(PointerEvent ev);
    void pointerUp(PointerEvent ev);
    void pointerCancel(PointerEvent ev);
    void doubleClick(PointerEvent ev);
    void wheel(const WheelEvent& ev);
    bool keyDown(std::string_view key, std::uint32_t modifiers);

    bool setTool(Tool tool);
    Tool tool() const noexcept { return session_.tool(); }
    InteractionMode mode() const noexcept { return session_.mode(); }
    geometry::CursorShape cursorAt(Point2 screen) const { return session_.cursorAt(screen); }

    // ==============================================================================
    // Editing
    // ==============================================================================
    bool undo();
    bool redo();
    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }

    bool select(const std::string& id) { return session_.select(id); }
    void clearSelection() noexcept { session_.clearSelection(); }
    const std::string& selectedId() const noexcept { return session_.selectedId(); }
    bool deleteSelection() { return session_.deleteSelection(); }
    bool setSelectionStyle(const ElementPatch& style) { return session_.setSelectionStyle(style); }
    bool bringToFront() { return session_.bringToFront(); }
    bool sendToBack() { return session_.sendToBack(); }
    std::string placeImage(const std::string& url, Point2 center, float width, float height);

    const WritingNode* writingNode() const noexcept { return session_.writingNode(); }
    bool setWritingText(std::string text) { return session_.setWritingText(std::move(text)); }
    bool commitWriting() { return session_.commitWriting(); }
    void cancelWriting() { session_.cancelWriting(); }

    // ==============================================================================
    // Render state
    // ==============================================================================
    const std::vector<ElementPtr>& elements() const noexcept { return store_.elements(); }
    std::uint64_t generation() const noexcept { return store_.generation(); }
    const Element* draft() const noexcept { return session_.draft(); }
    std::vector<std::string> textLines(const Element& element) const { return session_.textLines(element); }
    const Camera& camera() const noexcept { return session_.camera(); }
    void setCamera(const Camera& camera) { session_.setCamera(camera); }
    const std::vector<PresenceCursor>& remoteCursors() const noexcept { return sync_.remoteCursors(); }
    const LocalIdentity& identity() const noexcept { return sync_.identity(); }

    // ==============================================================================
    // Errors
    // ==============================================================================
    BoardError lastError() const noexcept { return session_.lastError(); }
    void clearError() noexcept { session_.clearError(); }
    std::size_t failedWrites() const noexcept { return sync_.failedWrites(); }

    ElementStore& store() noexcept { return store_; }
    HistoryManager& history() noexcept { return history_; }
    SyncSession& sync() noexcept { return sync_; }
    InteractionSession& session() noexcept { return session_; }
    const BoardConfig& config() const noexcept { return config_; }

private:
    void onLocalMutation();
    void uploadThumbnail();
    static double stampTime(double timeMs);

    BoardConfig config_;
    ElementStore store_;
    IdGenerator ids_;
    text::FontManager fonts_;
    text::FontTextMeasurer measurer_;
    SyncSession sync_;
    HistoryManager history_;
    InteractionSession session_;
    ThumbnailScheduler thumbnails_;

    ThumbnailRenderer* thumbnailRenderer_ = nullptr;
    ThumbnailUploader* thumbnailUploader_ = nullptr;
    bool mounted_ = false;
    // Frame clock of the last tick(); unset until the shell starts ticking.
    std::optional<double> lastTickMs_;
};

} // namespace board
