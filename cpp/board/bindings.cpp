#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>

#include "board/board_engine.h"
#include "board/geometry/handles.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

using emscripten::val;
using namespace board;

// ==============================================================================
// Element <-> JS object
// ==============================================================================

val pointsToVal(const std::vector<Point2>& points) {
    val out = val::array();
    for (std::size_t i = 0; i < points.size(); ++i) {
        val p = val::object();
        p.set("x", points[i].x);
        p.set("y", points[i].y);
        out.set(i, p);
    }
    return out;
}

std::vector<Point2> valToPoints(const val& arr) {
    std::vector<Point2> out;
    const unsigned n = arr["length"].as<unsigned>();
    out.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        out.push_back({arr[i]["x"].as<float>(), arr[i]["y"].as<float>()});
    }
    return out;
}

val dashToVal(const std::vector<float>& dash) {
    val out = val::array();
    for (std::size_t i = 0; i < dash.size(); ++i) out.set(i, dash[i]);
    return out;
}

std::vector<float> valToDash(const val& arr) {
    std::vector<float> out;
    const unsigned n = arr["length"].as<unsigned>();
    for (unsigned i = 0; i < n; ++i) out.push_back(arr[i].as<float>());
    return out;
}

bool has(const val& obj, const char* key) {
    const val v = obj[key];
    return !v.isUndefined() && !v.isNull();
}

val elementToVal(const Element& el) {
    val o = val::object();
    o.set("id", el.id);
    o.set("spaceId", el.spaceId);
    o.set("authorId", el.authorId);
    o.set("kind", std::string(kindName(el.kind)));
    o.set("x", el.x);
    o.set("y", el.y);
    if (el.width) o.set("width", *el.width);
    if (el.height) o.set("height", *el.height);
    if (usesPathPoints(el.kind)) o.set("points", pointsToVal(el.points));
    o.set("strokeColor", el.strokeColor);
    o.set("fillColor", el.fillColor);
    o.set("strokeWidth", el.strokeWidth);
    o.set("strokeDash", dashToVal(el.strokeDash));
    o.set("opacity", el.opacity);
    o.set("rotation", el.rotation);
    if (el.kind == ElementKind::Text) {
        o.set("text", el.text);
        o.set("fontFamily", el.fontFamily);
        o.set("fontSize", el.fontSize);
        o.set("textAlign", std::string(textAlignName(el.textAlign)));
    }
    if (el.kind == ElementKind::Image) o.set("imageUrl", el.imageUrl);
    o.set("layer", static_cast<double>(el.layer));
    o.set("deleted", el.deleted);
    o.set("createdAt", el.createdAt);
    o.set("updatedAt", el.updatedAt);
    return o;
}

// Reads only the keys present on `o`.
ElementPatch valToPatch(const val& o) {
    ElementPatch p;
    if (has(o, "x")) p.x = o["x"].as<float>();
    if (has(o, "y")) p.y = o["y"].as<float>();
    if (has(o, "width")) p.width = o["width"].as<float>();
    if (has(o, "height")) p.height = o["height"].as<float>();
    if (has(o, "points")) p.points = valToPoints(o["points"]);
    if (has(o, "strokeColor")) p.strokeColor = o["strokeColor"].as<std::string>();
    if (has(o, "fillColor")) p.fillColor = o["fillColor"].as<std::string>();
    if (has(o, "strokeWidth")) p.strokeWidth = o["strokeWidth"].as<float>();
    if (has(o, "strokeDash")) p.strokeDash = valToDash(o["strokeDash"]);
    if (has(o, "opacity")) p.opacity = o["opacity"].as<float>();
    if (has(o, "rotation")) p.rotation = o["rotation"].as<float>();
    if (has(o, "text")) p.text = o["text"].as<std::string>();
    if (has(o, "fontFamily")) p.fontFamily = o["fontFamily"].as<std::string>();
    if (has(o, "fontSize")) p.fontSize = o["fontSize"].as<float>();
    if (has(o, "textAlign")) p.textAlign = parseTextAlign(o["textAlign"].as<std::string>());
    if (has(o, "imageUrl")) p.imageUrl = o["imageUrl"].as<std::string>();
    if (has(o, "layer")) p.layer = static_cast<std::int64_t>(o["layer"].as<double>());
    if (has(o, "deleted")) p.deleted = o["deleted"].as<bool>();
    return p;
}

val patchToVal(const ElementPatch& p) {
    val o = val::object();
    if (p.x) o.set("x", *p.x);
    if (p.y) o.set("y", *p.y);
    if (p.width) o.set("width", *p.width);
    if (p.height) o.set("height", *p.height);
    if (p.points) o.set("points", pointsToVal(*p.points));
    if (p.strokeColor) o.set("strokeColor", *p.strokeColor);
    if (p.fillColor) o.set("fillColor", *p.fillColor);
    if (p.strokeWidth) o.set("strokeWidth", *p.strokeWidth);
    if (p.strokeDash) o.set("strokeDash", dashToVal(*p.strokeDash));
    if (p.opacity) o.set("opacity", *p.opacity);
    if (p.rotation) o.set("rotation", *p.rotation);
    if (p.text) o.set("text", *p.text);
    if (p.fontFamily) o.set("fontFamily", *p.fontFamily);
    if (p.fontSize) o.set("fontSize", *p.fontSize);
    if (p.textAlign) o.set("textAlign", std::string(textAlignName(*p.textAlign)));
    if (p.imageUrl) o.set("imageUrl", *p.imageUrl);
    if (p.layer) o.set("layer", static_cast<double>(*p.layer));
    if (p.deleted) o.set("deleted", *p.deleted);
    return o;
}

Element valToElement(const val& o) {
    Element el;
    el.id = o["id"].as<std::string>();
    if (has(o, "spaceId")) el.spaceId = o["spaceId"].as<std::string>();
    if (has(o, "authorId")) el.authorId = o["authorId"].as<std::string>();
    if (has(o, "kind")) el.kind = parseKind(o["kind"].as<std::string>()).value_or(ElementKind::Rect);
    if (has(o, "createdAt")) el.createdAt = o["createdAt"].as<double>();
    if (has(o, "updatedAt")) el.updatedAt = o["updatedAt"].as<double>();
    return applyPatch(el, valToPatch(o));
}

PersistResult makeResult(int status, const std::string& message) {
    if (status < 0 || status > static_cast<int>(PersistStatus::Rejected)) status = static_cast<int>(PersistStatus::Rejected);
    return {static_cast<PersistStatus>(status), message};
}

// ==============================================================================
// JS-backed capabilities
// ==============================================================================

/**
 * Adapts a JS backend object to the persistence and realtime capabilities.
 * Requests are tagged with an id; JS completes them through resolve*().
 */
class JsBackend : public ElementRepository, public RealtimeChannel {
public:
    explicit JsBackend(val js) : js_(std::move(js)) {}

    void fetch(const std::string& spaceId, FetchCallback done) override {
        const std::uint32_t req = nextRequest_++;
        fetches_[req] = std::move(done);
        js_.call<void>("fetch", spaceId, req);
    }

    void insert(const Element& element, InsertCallback done) override {
        const std::uint32_t req = nextRequest_++;
        inserts_[req] = std::move(done);
        js_.call<void>("insert", elementToVal(element), req);
    }

    void update(const std::string& id, const ElementPatch& patch, AckCallback done) override {
        const std::uint32_t req = nextRequest_++;
        acks_[req] = std::move(done);
        js_.call<void>("update", id, patchToVal(patch), req);
    }

    void subscribe(const std::string& spaceId, ChangeHandler onChange, PresenceHandler onPresence) override {
        onChange_ = std::move(onChange);
        onPresence_ = std::move(onPresence);
        js_.call<void>("subscribe", spaceId);
    }

    void publishPresence(const PresenceCursor& cursor) override {
        val o = val::object();
        o.set("userId", cursor.userId);
        o.set("x", cursor.point.x);
        o.set("y", cursor.point.y);
        o.set("color", cursor.color);
        o.set("displayName", cursor.displayName);
        js_.call<void>("publishPresence", o);
    }

    void unsubscribe() override {
        onChange_ = nullptr;
        onPresence_ = nullptr;
        js_.call<void>("unsubscribe");
    }

    void resolveFetch(std::uint32_t req, int status, const std::string& message, const val& rows) {
        auto it = fetches_.find(req);
        if (it == fetches_.end()) return;
        FetchCallback done = std::move(it->second);
        fetches_.erase(it);
        std::vector<Element> elements;
        if (!rows.isNull() && !rows.isUndefined()) {
            const unsigned n = rows["length"].as<unsigned>();
            elements.reserve(n);
            for (unsigned i = 0; i < n; ++i) elements.push_back(valToElement(rows[i]));
        }
        done(makeResult(status, message), std::move(elements));
    }

    void resolveInsert(std::uint32_t req, int status, const std::string& message, const val& row) {
        auto it = inserts_.find(req);
        if (it == inserts_.end()) return;
        InsertCallback done = std::move(it->second);
        inserts_.erase(it);
        std::optional<Element> stored;
        if (!row.isNull() && !row.isUndefined()) stored = valToElement(row);
        done(makeResult(status, message), std::move(stored));
    }

    void resolveUpdate(std::uint32_t req, int status, const std::string& message) {
        auto it = acks_.find(req);
        if (it == acks_.end()) return;
        AckCallback done = std::move(it->second);
        acks_.erase(it);
        done(makeResult(status, message));
    }

    void pushChange(const std::string& type, const val& row) {
        if (!onChange_) return;
        ChangeEvent event;
        event.type = type == "insert" ? ChangeType::Insert : ChangeType::Update;
        event.element = valToElement(row);
        onChange_(event);
    }

    void pushPresence(const val& cursors) {
        if (!onPresence_) return;
        std::vector<PresenceCursor> snapshot;
        const unsigned n = cursors["length"].as<unsigned>();
        for (unsigned i = 0; i < n; ++i) {
            const val c = cursors[i];
            PresenceCursor cursor;
            cursor.userId = c["userId"].as<std::string>();
            cursor.point = {c["x"].as<float>(), c["y"].as<float>()};
            if (has(c, "color")) cursor.color = c["color"].as<std::string>();
            if (has(c, "displayName")) cursor.displayName = c["displayName"].as<std::string>();
            snapshot.push_back(std::move(cursor));
        }
        onPresence_(snapshot);
    }

private:
    val js_;
    std::uint32_t nextRequest_ = 1;
    std::unordered_map<std::uint32_t, FetchCallback> fetches_;
    std::unordered_map<std::uint32_t, InsertCallback> inserts_;
    std::unordered_map<std::uint32_t, AckCallback> acks_;
    ChangeHandler onChange_;
    PresenceHandler onPresence_;
};

// Flat-argument facade for JS.
class WasmBoard {
public:
    explicit WasmBoard(val backend) : backend_(std::move(backend)), engine_(backend_, backend_) {}

    bool mount(const std::string& spaceId, const std::string& userId, const std::string& displayName,
        const std::string& color, bool canEdit) {
        MountOptions options;
        options.spaceId = spaceId;
        options.userId = userId;
        if (!displayName.empty() || !color.empty()) options.profile = DisplayProfile{displayName, "", color};
        options.canEdit = canEdit;
        return engine_.mount(options);
    }
    void leave() { engine_.leave(); }
    void tick(double nowMs) { engine_.tick(nowMs); }

    void resolveFetch(std::uint32_t req, int status, const std::string& message, val rows) { backend_.resolveFetch(req, status, message, rows); }
    void resolveInsert(std::uint32_t req, int status, const std::string& message, val row) { backend_.resolveInsert(req, status, message, row); }
    void resolveUpdate(std::uint32_t req, int status, const std::string& message) { backend_.resolveUpdate(req, status, message); }
    void pushChange(const std::string& type, val row) { backend_.pushChange(type, row); }
    void pushPresence(val cursors) { backend_.pushPresence(cursors); }

    void pointerDown(float x, float y, int button, std::uint32_t mods, double t) { engine_.pointerDown(event(x, y, button, mods, t)); }
    void pointerMove(float x, float y, int button, std::uint32_t mods, double t) { engine_.pointerMove(event(x, y, button, mods, t)); }
    void pointerUp(float x, float y, int button, std::uint32_t mods, double t) { engine_.pointerUp(event(x, y, button, mods, t)); }
    void pointerCancel(float x, float y, int button, std::uint32_t mods, double t) { engine_.pointerCancel(event(x, y, button, mods, t)); }
    void doubleClick(float x, float y, int button, std::uint32_t mods, double t) { engine_.doubleClick(event(x, y, button, mods, t)); }
    void wheel(float x, float y, float dx, float dy, std::uint32_t mods) { engine_.wheel(WheelEvent{x, y, dx, dy, mods}); }
    bool keyDown(const std::string& key, std::uint32_t mods) { return engine_.keyDown(key, mods); }

    bool setTool(const std::string& name) {
        const std::optional<Tool> tool = parseTool(name);
        return tool && engine_.setTool(*tool);
    }
    std::string getTool() const { return toolName(engine_.tool()); }
    std::string getMode() const { return modeName(engine_.mode()); }
    std::string getCursor(float x, float y) const { return geometry::cursorName(engine_.cursorAt({x, y})); }

    bool undo() { return engine_.undo(); }
    bool redo() { return engine_.redo(); }
    bool select(const std::string& id) { return engine_.select(id); }
    void clearSelection() { engine_.clearSelection(); }
    std::string getSelectedId() const { return engine_.selectedId(); }
    bool deleteSelection() { return engine_.deleteSelection(); }
    bool setSelectionStyle(val style) { return engine_.setSelectionStyle(valToPatch(style)); }
    bool bringToFront() { return engine_.bringToFront(); }
    bool sendToBack() { return engine_.sendToBack(); }
    std::string placeImage(const std::string& url, float x, float y, float w, float h) { return engine_.placeImage(url, {x, y}, w, h); }

    bool setWritingText(const std::string& text) { return engine_.setWritingText(text); }
    bool commitWriting() { return engine_.commitWriting(); }
    void cancelWriting() { engine_.cancelWriting(); }
    val getWritingNode() const {
        const WritingNode* node = engine_.writingNode();
        if (!node) return val::null();
        val o = val::object();
        o.set("elementId", node->elementId.value_or(""));
        o.set("x", node->position.x);
        o.set("y", node->position.y);
        o.set("width", node->width);
        o.set("text", node->text);
        o.set("color", node->strokeColor);
        o.set("fontFamily", node->fontFamily);
        o.set("fontSize", node->fontSize);
        o.set("rotation", node->rotation);
        return o;
    }

    val getElements() const {
        val out = val::array();
        const auto& elements = engine_.elements();
        for (std::size_t i = 0; i < elements.size(); ++i) out.set(i, elementToVal(*elements[i]));
        return out;
    }
    val getDraft() const {
        const Element* draft = engine_.draft();
        return draft ? elementToVal(*draft) : val::null();
    }
    val getTextLines(const std::string& id) {
        val out = val::array();
        ElementPtr el = engine_.store().find(id);
        if (!el) return out;
        const std::vector<std::string> lines = engine_.textLines(*el);
        for (std::size_t i = 0; i < lines.size(); ++i) out.set(i, lines[i]);
        return out;
    }
    val getRemoteCursors() const {
        val out = val::array();
        const auto& cursors = engine_.remoteCursors();
        for (std::size_t i = 0; i < cursors.size(); ++i) {
            val o = val::object();
            o.set("userId", cursors[i].userId);
            o.set("x", cursors[i].point.x);
            o.set("y", cursors[i].point.y);
            o.set("color", cursors[i].color);
            o.set("displayName", cursors[i].displayName);
            out.set(i, o);
        }
        return out;
    }
    val getCamera() const {
        val o = val::object();
        o.set("x", engine_.camera().x);
        o.set("y", engine_.camera().y);
        o.set("z", engine_.camera().z);
        return o;
    }
    void setCamera(float x, float y, float z) { engine_.setCamera(Camera{x, y, z}); }

    double getGeneration() const { return static_cast<double>(engine_.generation()); }
    int getLastError() const { return static_cast<int>(engine_.lastError()); }
    void clearError() { engine_.clearError(); }
    double getFailedWrites() const { return static_cast<double>(engine_.failedWrites()); }
    bool canUndo() const { return engine_.canUndo(); }
    bool canRedo() const { return engine_.canRedo(); }

private:
    static PointerEvent event(float x, float y, int button, std::uint32_t mods, double t) {
        PointerEvent ev;
        ev.x = x;
        ev.y = y;
        ev.button = button == 1 ? PointerButton::Middle : (button == 2 ? PointerButton::Secondary : PointerButton::Primary);
        ev.modifiers = mods;
        ev.timeMs = t;
        return ev;
    }

    JsBackend backend_;
    BoardEngine engine_;
};

} // namespace

EMSCRIPTEN_BINDINGS(board_engine_module) {
    emscripten::class_<WasmBoard>("BoardEngine")
        .constructor<val>()
        .function("mount", &WasmBoard::mount)
        .function("leave", &WasmBoard::leave)
        .function("tick", &WasmBoard::tick)
        .function("resolveFetch", &WasmBoard::resolveFetch)
        .function("resolveInsert", &WasmBoard::resolveInsert)
        .function("resolveUpdate", &WasmBoard::resolveUpdate)
        .function("pushChange", &WasmBoard::pushChange)
        .function("pushPresence", &WasmBoard::pushPresence)
        .function("pointerDown", &WasmBoard::pointerDown)
        .function("pointerMove", &WasmBoard::pointerMove)
        .function("pointerUp", &WasmBoard::pointerUp)
        .function("pointerCancel", &WasmBoard::pointerCancel)
        .function("doubleClick", &WasmBoard::doubleClick)
        .function("wheel", &WasmBoard::wheel)
        .function("keyDown", &WasmBoard::keyDown)
        .function("setTool", &WasmBoard::setTool)
        .function("getTool", &WasmBoard::getTool)
        .function("getMode", &WasmBoard::getMode)
        .function("getCursor", &WasmBoard::getCursor)
        .function("undo", &WasmBoard::undo)
        .function("redo", &WasmBoard::redo)
        .function("canUndo", &WasmBoard::canUndo)
        .function("canRedo", &WasmBoard::canRedo)
        .function("select", &WasmBoard::select)
        .function("clearSelection", &WasmBoard::clearSelection)
        .function("getSelectedId", &WasmBoard::getSelectedId)
        .function("deleteSelection", &WasmBoard::deleteSelection)
        .function("setSelectionStyle", &WasmBoard::setSelectionStyle)
        .function("bringToFront", &WasmBoard::bringToFront)
        .function("sendToBack", &WasmBoard::sendToBack)
        .function("placeImage", &WasmBoard::placeImage)
        .function("setWritingText", &WasmBoard::setWritingText)
        .function("commitWriting", &WasmBoard::commitWriting)
        .function("cancelWriting", &WasmBoard::cancelWriting)
        .function("getWritingNode", &WasmBoard::getWritingNode)
        .function("getElements", &WasmBoard::getElements)
        .function("getDraft", &WasmBoard::getDraft)
        .function("getTextLines", &WasmBoard::getTextLines)
        .function("getRemoteCursors", &WasmBoard::getRemoteCursors)
        .function("getCamera", &WasmBoard::getCamera)
        .function("setCamera", &WasmBoard::setCamera)
        .function("getGeneration", &WasmBoard::getGeneration)
        .function("getLastError", &WasmBoard::getLastError)
        .function("clearError", &WasmBoard::clearError)
        .function("getFailedWrites", &WasmBoard::getFailedWrites);
}
#endif
