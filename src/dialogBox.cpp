#include "dialogBox.hpp"
#include <sstream>

DialogBox::DialogBox() = default;

DialogBox::~DialogBox() = default;

std::vector<std::string> DialogBox::wrapText(float maxWidth) const
{
    std::vector<std::string> lines;
    std::istringstream words(this->text);
    std::string word;
    std::string line;

    while (words >> word)
    {
        std::string candidate = line.empty() ? word : line + " " + word;
        if (!line.empty() && (float)MeasureText(candidate.c_str(), this->fontSize) > maxWidth)
        {
            lines.push_back(line);
            line = word;
        }
        else
        {
            line = candidate;
        }
    }
    if (!line.empty())
        lines.push_back(line);
    return lines;
}

bool DialogBox::Draw() const
{
    if (this->text.empty())
        return false;

    DrawRectangleRec(this->area, this->boxBackground);
    DrawRectangleLinesEx(this->area, 2.0f, this->boxOutline);

    float x = this->area.x + this->padding;
    float y = this->area.y + this->padding;
    float maxWidth = this->area.width - this->padding * 2.0f;

    for (const std::string &line : this->wrapText(maxWidth))
    {
        DrawText(line.c_str(), (int)x, (int)y, this->fontSize, this->textColor);
        y += this->fontSize + this->lineSpacing;
    }

    if (!this->hint.empty())
    {
        int hintWidth = MeasureText(this->hint.c_str(), this->fontSize);
        float hintX = this->area.x + this->area.width - this->padding - hintWidth;
        float hintY = this->area.y + this->area.height - this->padding - this->fontSize;
        DrawText(this->hint.c_str(), (int)hintX, (int)hintY, this->fontSize, this->hintColor);
    }
    return true;
}
