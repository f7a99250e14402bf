#ifndef BOARD_TEXT_FONT_MANAGER_H
#define BOARD_TEXT_FONT_MANAGER_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace board::text {

/**
 * FontHandle: a loaded face with its FreeType face and HarfBuzz font.
 */
struct FontHandle {
    std::uint32_t id;
    std::string familyName;

    FT_Face ftFace;
    hb_font_t* hbFont;

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: owns the FreeType library and the faces loaded for text
 * measurement. Faces are looked up by id or by family name; id 0 resolves to
 * the first font loaded.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();
    void shutdown();

    /**
     * Load a font from memory.
     * @param fontData Raw TTF/OTF data (copied and owned by FontManager)
     * @param dataSize Size of font data in bytes
     * @param familyName Optional family name override
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize, const std::string& familyName = "");

    /**
     * Load a font from file path.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath, const std::string& familyName = "");

    const FontHandle* getFont(std::uint32_t fontId) const;

    // Font registered under `familyName`, falling back to the default font.
    const FontHandle* findFont(const std::string& familyName) const;

    // Sets the pixel size used by subsequent shaping with this font.
    bool setFontSize(std::uint32_t fontId, float fontSize);

private:
    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData,
        const std::string& familyName);

    FontHandle* getFontMutable(std::uint32_t fontId);
    void destroyHandle(FontHandle& handle);

    FT_Library ftLibrary_ = nullptr;
    bool initialized_ = false;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;
};

} // namespace board::text

#endif // BOARD_TEXT_FONT_MANAGER_H
