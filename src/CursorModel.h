// The CursorModel tracks the cursor of the emulated display as a linear
// buffer position.  Host orders position it directly; operator input goes
// through moveCursor(), which refuses to move while the keyboard is locked.

#ifndef _INCLUDE_CURSOR_MODEL_H_
#define _INCLUDE_CURSOR_MODEL_H_

#include "w5250.h"

class FieldTable;
class Oia;
class ScreenBuffer;

class CursorModel
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(CursorModel);

    CursorModel(const ScreenBuffer &screen, const Oia &oia, FieldTable &fields);
    ~CursorModel() = default;

    // position from a 1-based row and column, without any range checking.
    // row or column 0 give a negative position, and values beyond the
    // screen give a position past the end of the buffer.
    void setCursor(int row, int col) noexcept;

    // operator movement.  returns false, leaving the cursor where it is,
    // if the keyboard is locked or pos is not within the buffer.
    bool moveCursor(int pos);

    // Set Buffer Address order, 1-based.  returns false without touching
    // the cursor unless 1 <= row <= rows and 1 <= col <= cols.
    bool processSetBufferAddress(int row, int col);

    // move to the start of a field, 1-based, and make it current.
    // goes through moveCursor(), so a locked keyboard refuses it too.
    bool gotoField(int index);

    // host positioning within the buffer; pos must be valid
    void setAddress(int pos) noexcept;

    int  getPosition() const noexcept { return m_pos; }

    // 1-based row and column of the cursor
    int  getCurrentRow() const noexcept;
    int  getCurrentCol() const noexcept;

    void setCursorActive(bool active) noexcept { m_active = active; }
    bool isCursorActive() const noexcept { return m_active; }

    void setCursorOn()  noexcept { m_visible = true;  }
    void setCursorOff() noexcept { m_visible = false; }
    bool isCursorShown() const noexcept { return m_visible; }

private:
    const ScreenBuffer &m_screen;
    const Oia          &m_oia;
    FieldTable         &m_fields;

    int   m_pos;        // linear position; may be out of range after setCursor()
    bool  m_active;     // cursor is being tracked
    bool  m_visible;    // cursor is drawn
};

#endif // _INCLUDE_CURSOR_MODEL_H_

// vim: ts=8:et:sw=4:smarttab
