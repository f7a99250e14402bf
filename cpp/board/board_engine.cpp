#include "board/board_engine.h"

#include "board/core/logging.h"
#include "board/core/util.h"

#include <utility>

namespace board {

BoardEngine::BoardEngine(ElementRepository& repository, RealtimeChannel& channel, BoardConfig config)
    : config_(std::move(config)),
      measurer_(fonts_),
      sync_(store_, repository, channel, config_),
      history_(store_, sync_),
      session_(store_, history_, sync_, config_, measurer_, ids_),
      thumbnails_(config_.thumbnailDebounceMs) {
    if (!fonts_.initialize()) {
        BOARD_LOG_WARN("engine: font system unavailable, using approximate text metrics");
    }

    sync_.setRemovalHandler([this](const std::string& id) {
        session_.handleElementRemoved(id);
    });
    sync_.setFailureHandler([this](const PersistResult&) {
        session_.reportError(BoardError::PersistFailed);
    });
    session_.setMutationListener([this]() { onLocalMutation(); });
}

BoardEngine::~BoardEngine() {
    leave();
}

bool BoardEngine::mount(const MountOptions& options) {
    if (options.spaceId.empty() || options.userId.empty()) {
        session_.reportError(BoardError::InvalidInput);
        return false;
    }
    if (mounted_) leave();

    LocalIdentity identity;
    identity.userId = options.userId;
    if (options.profile) {
        identity.displayName = options.profile->displayName;
        identity.color = options.profile->color;
    }
    if (identity.displayName.empty()) identity.displayName = options.userId;

    store_.clear();
    history_.clear();
    session_.clearSelection();
    session_.setCanEdit(options.canEdit);
    mounted_ = true;

    BOARD_LOG_DEBUG("engine: mounting %s (canEdit=%d)", options.spaceId.c_str(), options.canEdit ? 1 : 0);
    sync_.join(options.spaceId, std::move(identity));
    return true;
}

void BoardEngine::leave() {
    if (!mounted_) return;
    session_.cancelWriting();
    session_.clearSelection();
    sync_.leave();
    thumbnails_.cancel();
    mounted_ = false;
}

void BoardEngine::setThumbnailServices(ThumbnailRenderer* renderer, ThumbnailUploader* uploader) {
    thumbnailRenderer_ = renderer;
    thumbnailUploader_ = uploader;
}

std::uint32_t BoardEngine::loadFont(const std::uint8_t* data, std::size_t size, const std::string& family) {
    if (!data || size == 0) {
        session_.reportError(BoardError::InvalidInput);
        return 0;
    }
    const std::uint32_t id = fonts_.loadFontFromMemory(data, size, family);
    if (id == 0) session_.reportError(BoardError::InvalidInput);
    return id;
}

double BoardEngine::stampTime(double timeMs) {
    return timeMs > 0.0 ? timeMs : nowMs();
}

// ==============================================================================
// Input
// ==============================================================================

void BoardEngine::pointerDown(PointerEvent ev) {
    ev.timeMs = stampTime(ev.timeMs);
    session_.pointerDown(ev);
}

void BoardEngine::pointerMove(PointerEvent ev) {
    ev.timeMs = stampTime(ev.timeMs);
    session_.pointerMove(ev);
}

void BoardEngine::pointerUp(PointerEvent ev) {
    ev.timeMs = stampTime(ev.timeMs);
    session_.pointerUp(ev);
}

void BoardEngine::pointerCancel(PointerEvent ev) {
    ev.timeMs = stampTime(ev.timeMs);
    session_.pointerCancel(ev);
}

void BoardEngine::doubleClick(PointerEvent ev) {
    ev.timeMs = stampTime(ev.timeMs);
    session_.doubleClick(ev);
}

void BoardEngine::wheel(const WheelEvent& ev) {
    session_.wheel(ev);
}

bool BoardEngine::keyDown(std::string_view key, std::uint32_t modifiers) {
    const bool command = (modifiers & (Modifier::Ctrl | Modifier::Meta)) != 0;
    if (command && session_.writingNode() == nullptr) {
        const bool shift = (modifiers & Modifier::Shift) != 0;
        if (key == "z" || key == "Z") return shift ? redo() : undo();
        if (key == "y" || key == "Y") return redo();
    }
    return session_.keyDown(key, modifiers);
}

bool BoardEngine::setTool(Tool tool) {
    return session_.setTool(tool);
}

// ==============================================================================
// Editing
// ==============================================================================

bool BoardEngine::undo() {
    if (!session_.canEdit()) {
        session_.reportError(BoardError::ReadOnly);
        return false;
    }
    if (!history_.undo()) return false;
    session_.reconcile();
    onLocalMutation();
    return true;
}

bool BoardEngine::redo() {
    if (!session_.canEdit()) {
        session_.reportError(BoardError::ReadOnly);
        return false;
    }
    if (!history_.redo()) return false;
    session_.reconcile();
    onLocalMutation();
    return true;
}

std::string BoardEngine::placeImage(const std::string& url, Point2 center, float width, float height) {
    return session_.placeImage(url, center, width, height);
}

// ==============================================================================
// Frame loop
// ==============================================================================

void BoardEngine::tick(double nowMs) {
    lastTickMs_ = nowMs;
    sync_.tick(nowMs);
    if (thumbnails_.due(nowMs)) uploadThumbnail();
}

void BoardEngine::onLocalMutation() {
    // Debounce runs on the shell's frame clock; before the first tick the
    // shell clock is read directly.
    thumbnails_.touch(lastTickMs_ ? *lastTickMs_ : board::nowMs());
}

void BoardEngine::uploadThumbnail() {
    if (!thumbnailRenderer_ || !thumbnailUploader_ || !sync_.joined()) return;

    std::vector<std::uint8_t> bytes = thumbnailRenderer_->render();
    if (bytes.empty()) {
        BOARD_LOG_DEBUG("engine: thumbnail renderer produced no image");
        return;
    }
    const std::string spaceId = sync_.spaceId();
    thumbnailUploader_->upload(spaceId, std::move(bytes), [spaceId](const PersistResult& result, const std::string& url) {
        if (!result.ok()) {
            BOARD_LOG_WARN("engine: thumbnail upload for %s failed (%s): %s",
                spaceId.c_str(), persistStatusName(result.status), result.message.c_str());
            return;
        }
        BOARD_LOG_DEBUG("engine: thumbnail for %s at %s", spaceId.c_str(), url.c_str());
    });
}

} // namespace board
