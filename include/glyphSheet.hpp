#pragma once
#include <raylib.h>
#include <string>
#include <unordered_map>

/**
 * @brief Bitmap font loaded from a sprite sheet.
 *
 * The sheet holds fixed-size cells laid out row by row in the order of
 * `GlyphSheet::charset`. `generate()` must run before `get()`; it builds the
 * lookup table and loads the texture when a graphics context exists. Without
 * the texture, text falls back to raylib's default font at the same size.
 */
class GlyphSheet
{
public:
    static constexpr const char *charset = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ.,!?:'- ";

    GlyphSheet(const char *spritePath, int _scale, int _tilesPerRow = 16, int _cellWidth = 4, int _cellHeight = 6)
        : path(spritePath), scale(_scale), tilesPerRow(_tilesPerRow), cellWidth(_cellWidth), cellHeight(_cellHeight) {}
    ~GlyphSheet() = default;

    bool generate();
    bool isGenerated() const { return this->generated; }
    void cleanup();

    /**
     * @brief Source rectangle of `key` in the sheet (case-insensitive).
     * @return false for unknown characters or before `generate()`.
     */
    bool get(char key, Rectangle &out) const;

    /**
     * @brief Draw `text` starting at `position`, advancing `scale * 5` per glyph.
     * @return x coordinate after the last glyph.
     */
    float drawText(const std::string &text, Vector2 position, Color tint) const;

    int getScale() const { return this->scale; }
    float getAdvance() const { return (float)(this->scale * 5); }
    float getLineHeight() const { return (float)(this->cellHeight * this->scale); }

private:
    std::string path;
    int scale;
    int tilesPerRow;
    int cellWidth, cellHeight;
    Texture2D sheet{};
    std::unordered_map<char, Rectangle> glyphs;
    bool generated = false;
};
