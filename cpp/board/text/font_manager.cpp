#include "board/text/font_manager.h"

#include "board/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>

#include <fstream>

namespace board::text {

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        BOARD_LOG_ERROR("FT_Init_FreeType failed (%d)", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::destroyHandle(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& [id, handle] : fonts_) {
        if (handle) destroyHandle(*handle);
    }
    fonts_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

std::uint32_t FontManager::loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize, const std::string& familyName) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // FreeType reads from this buffer for the lifetime of the face
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,
        &face);

    if (error || !face) {
        BOARD_LOG_WARN("FT_New_Memory_Face failed (%d)", static_cast<int>(error));
        return 0;
    }

    std::string family = familyName;
    if (family.empty() && face->family_name) {
        family = face->family_name;
    }
    if (family.empty()) {
        family = "Unknown";
    }

    const std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy), family);
    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }

    fonts_[fontId] = std::move(handle);
    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }

    BOARD_LOG_DEBUG("loaded font %u (%s)", fontId, family.c_str());
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath, const std::string& familyName) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        BOARD_LOG_WARN("cannot open font file %s", filePath.c_str());
        return 0;
    }

    const std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size(), familyName);
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

FontHandle* FontManager::getFontMutable(std::uint32_t fontId) {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

const FontHandle* FontManager::findFont(const std::string& familyName) const {
    for (const auto& [id, handle] : fonts_) {
        if (handle && handle->familyName == familyName) return handle.get();
    }
    return getFont(0);
}

bool FontManager::setFontSize(std::uint32_t fontId, float fontSize) {
    FontHandle* handle = getFontMutable(fontId);
    if (!handle || !handle->ftFace || !(fontSize > 0.0f)) {
        return false;
    }

    // Char size in 26.6 fixed point at 72 DPI, so one point == one canvas unit
    FT_Error error = FT_Set_Char_Size(
        handle->ftFace,
        0,
        static_cast<FT_F26Dot6>(fontSize * 64),
        72,
        72);
    if (error) {
        return false;
    }

    if (handle->hbFont) {
        hb_font_set_scale(
            handle->hbFont,
            static_cast<int>(fontSize * 64),
            static_cast<int>(fontSize * 64));
    }
    return true;
}

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData,
    const std::string& familyName) {
    auto handle = std::make_unique<FontHandle>();
    handle->id = id;
    handle->familyName = familyName;
    handle->ftFace = face;
    handle->fontData = std::move(fontData);

    handle->hbFont = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont) {
        return nullptr;
    }
    return handle;
}

} // namespace board::text
