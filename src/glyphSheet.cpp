#include "glyphSheet.hpp"
#include <cctype>
#include <cstring>

bool GlyphSheet::generate()
{
    this->glyphs.clear();
    int count = (int)strlen(charset);
    for (int i = 0; i < count; ++i)
    {
        int row = i / this->tilesPerRow;
        int col = i % this->tilesPerRow;
        this->glyphs[charset[i]] = {(float)(col * this->cellWidth), (float)(row * this->cellHeight),
                                    (float)this->cellWidth, (float)this->cellHeight};
    }

    if (this->sheet.id == 0 && IsWindowReady())
    {
        if (FileExists(this->path.c_str()))
        {
            this->sheet = LoadTexture(this->path.c_str());
            if (this->sheet.id == 0)
                TraceLog(LOG_WARNING, "GLYPHS: failed to load '%s', using default font", this->path.c_str());
        }
        else
        {
            TraceLog(LOG_WARNING, "GLYPHS: '%s' not found, using default font", this->path.c_str());
        }
    }

    this->generated = true;
    return this->sheet.id != 0;
}

void GlyphSheet::cleanup()
{
    if (this->sheet.id != 0 && IsWindowReady())
        UnloadTexture(this->sheet);
    this->sheet = {};
    this->glyphs.clear();
    this->generated = false;
}

bool GlyphSheet::get(char key, Rectangle &out) const
{
    if (!this->generated)
        return false;
    auto it = this->glyphs.find((char)toupper((unsigned char)key));
    if (it == this->glyphs.end())
        return false;
    out = it->second;
    return true;
}

float GlyphSheet::drawText(const std::string &text, Vector2 position, Color tint) const
{
    float x = position.x;
    for (char c : text)
    {
        Rectangle source;
        if (this->sheet.id != 0 && this->get(c, source))
        {
            Rectangle dest{x, position.y, source.width * this->scale, source.height * this->scale};
            DrawTexturePro(this->sheet, source, dest, {0.0f, 0.0f}, 0.0f, tint);
        }
        else
        {
            char glyph[2] = {c, '\0'};
            DrawText(glyph, (int)x, (int)position.y, (int)this->getLineHeight(), tint);
        }
        x += this->getAdvance();
    }
    return x;
}
