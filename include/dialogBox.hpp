#pragma once
#include <raylib.h>
#include <string>
#include <vector>

/**
 * @brief Framed text panel used by the tutorial dialogue.
 *
 * Draws into whatever render target is active. Text is word-wrapped to the
 * panel width with raylib's default font; a hint line is drawn at the bottom.
 */
class DialogBox
{
public:
    DialogBox();
    ~DialogBox();

    DialogBox(const DialogBox &) = delete;
    DialogBox &operator=(const DialogBox &) = delete;
    DialogBox(DialogBox &&) = delete;
    DialogBox &operator=(DialogBox &&) = delete;

    void setText(const std::string &t) { this->text = t; }
    void setHint(const std::string &h) { this->hint = h; }
    void setArea(const Rectangle &r) { this->area = r; }
    bool Draw() const;

private:
    std::string text;
    std::string hint = "SPACE to continue";
    Rectangle area{56.0f, 72.0f, 400.0f, 112.0f};

    int fontSize = 10;
    float padding = 10.0f;
    float lineSpacing = 4.0f;

    Color boxOutline{255, 255, 255, 255};
    Color boxBackground{20, 20, 24, 255};
    Color textColor{230, 230, 230, 255};
    Color hintColor{255, 203, 0, 255};

    std::vector<std::string> wrapText(float maxWidth) const;
};
