// This class holds the contents of the emulated 5250 display as a set of
// parallel planes, one entry per character cell:
//
//    character plane  - the character code in the cell
//    color plane      - the 5250 attribute code (32..63) governing the cell
//    extended plane   - underline/column separator/non-display bits which
//                       are derived from the attribute code
//    gui plane        - an opaque marker owned by the renderer; never
//                       interpreted here
//
// Positions are linear offsets, row*cols + col, both 0-based.  Except where
// noted, callers are responsible for passing a valid position.

#ifndef _INCLUDE_SCREEN_BUFFER_H_
#define _INCLUDE_SCREEN_BUFFER_H_

#include "w5250.h"

// bits of the extended plane
enum ext_attr_t : uint8 {
    EXT_ATTR_UNDERLINE = 0x01,  // draw an underline
    EXT_ATTR_COL_SEP   = 0x02,  // draw column separators
    EXT_ATTR_NON_DSP   = 0x04,  // don't display the character
};

// plane selector for getPlaneData() and getData()
enum plane_t {
    PLANE_TEXT,
    PLANE_COLOR,
    PLANE_EXTENDED,
    PLANE_GUI
};

class ScreenBuffer
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(ScreenBuffer);

    ScreenBuffer(int rows, int cols);
    ~ScreenBuffer() = default;

    // the attribute code every cell gets on clear: green, normal
    static const uint8 INIT_ATTR = 32;

    // the character every cell gets on clear
    static const uint8 INIT_CHAR = 0x00;

    // ---- geometry ----
    int  getRows()         const noexcept { return m_rows; }
    int  getCols()         const noexcept { return m_cols; }
    int  getScreenLength() const noexcept { return m_rows * m_cols; }
    bool isValidPos(int pos) const noexcept
        { return (pos >= 0) && (pos < getScreenLength()); }

    // 0-based row and column of a linear position
    int  getRow(int pos) const noexcept { return pos / m_cols; }
    int  getCol(int pos) const noexcept { return pos % m_cols; }
    int  getPos(int row, int col) const noexcept { return row * m_cols + col; }

    // reallocate all planes.  cells whose position exists in both the old
    // and the new geometry keep their contents; the rest are cleared.
    // any saved error line is discarded.
    void resize(int rows, int cols);

    // reset every cell to the empty character and the default attribute.
    // a saved error line belongs to the old contents and is dropped.
    void clearAll();

    // ---- plane access ----
    void  setChar(int pos, uint8 ch);
    uint8 getChar(int pos) const;

    // store an attribute code and disperse it into the extended plane.
    // only the low byte of attr is kept.
    // code 0 leaves the planes untouched.
    void  setAttribute(int pos, int attr);
    uint8 getAttribute(int pos) const;

    uint8 getExtended(int pos) const;
    bool  isUnderline(int pos) const;
    bool  isColumnSeparator(int pos) const;
    bool  isNonDisplay(int pos) const;

    void  setGui(int pos, uint8 marker);
    uint8 getGui(int pos) const;

    // copy length cells of one plane starting at pos.  cells outside the
    // buffer are not returned, so the result may be shorter than requested.
    std::vector<uint8> getPlaneData(int pos, int length, plane_t plane) const;

    // copy a rectangle of one plane; rows and columns are 0-based and
    // inclusive.  an inverted or out-of-range rectangle yields nothing.
    std::vector<uint8> getData(int start_row, int start_col,
                               int end_row,   int end_col,
                               plane_t plane) const;

    // the whole screen as text, with nulls and non-display cells as blanks
    std::string getScreenAsChars() const;

    // the whole character plane, untouched
    std::string getScreenAsAllChars() const;

    // ---- error line ----
    // the error line is the row that operator error messages overwrite.
    // saving it first lets the prior contents come back on reset.

    // 1-based row; an out-of-range row selects the last row
    void setErrorLineNum(int row) noexcept;
    int  getErrorLineNum() const noexcept { return m_error_line; }

    void saveErrorLine();
    void restoreErrorLine();
    bool isErrorLineSaved() const noexcept { return m_error_saved; }

    // ---- renderer support ----
    bool isDirty() const noexcept { return m_dirty; }
    void clearDirty() noexcept { m_dirty = false; }

private:
    // look up the extended bits implied by an attribute code
    static uint8 disperseAttribute(int attr) noexcept;

    // copy of the planes of one row
    struct line_save_t {
        std::vector<uint8> chars;
        std::vector<uint8> color;
        std::vector<uint8> extended;
        std::vector<uint8> gui;
    };

    const std::vector<uint8>& plane(plane_t which) const;

    int  m_rows;                    // display height, in characters
    int  m_cols;                    // display width, in characters

    std::vector<uint8> m_chars;     // character codes
    std::vector<uint8> m_color;     // attribute codes
    std::vector<uint8> m_extended;  // ext_attr_t bits
    std::vector<uint8> m_gui;       // renderer markers

    int         m_error_line;       // 1-based row of the error line
    bool        m_error_saved;      // m_error_save holds a snapshot
    line_save_t m_error_save;       // saved error line

    bool        m_dirty;            // something has changed since last refresh
};

#endif // _INCLUDE_SCREEN_BUFFER_H_

// vim: ts=8:et:sw=4:smarttab
