// This file implements the ScreenBuffer class, which holds the character
// planes of the emulated display.
//
// The attribute code of a cell is what the host sent in the data stream:
//
//     0x20 + {0x00 .. 0x1F}
//
// where, within each block of eight codes, bit 0 selects reverse image,
// bit 1 high intensity (or a second color), and bit 2 underline.  All bits
// set (codes 39, 47, 55, 63) means non-display.  Codes 48..51 are the
// column-separator block.  Reverse image is carried in the code itself; the
// renderer picks it out of the color plane.

#include "ScreenBuffer.h"

#include <algorithm>

const uint8 ScreenBuffer::INIT_ATTR;
const uint8 ScreenBuffer::INIT_CHAR;

// ----------------------------------------------------------------------------
// ScreenBuffer
// ----------------------------------------------------------------------------

ScreenBuffer::ScreenBuffer(int rows, int cols) :
    m_rows(rows),
    m_cols(cols),
    m_error_line(rows),
    m_error_saved(false),
    m_dirty(true)
{
    assert(rows > 0 && cols > 0);
    const int len = getScreenLength();
    m_chars.assign(len, INIT_CHAR);
    m_color.assign(len, INIT_ATTR);
    m_extended.assign(len, 0x00);
    m_gui.assign(len, 0x00);
}


void
ScreenBuffer::resize(int rows, int cols)
{
    assert(rows > 0 && cols > 0);

    const int len = rows * cols;

    // std::vector::resize keeps the leading cells and fills the rest
    m_chars.resize(len, INIT_CHAR);
    m_color.resize(len, INIT_ATTR);
    m_extended.resize(len, 0x00);
    m_gui.resize(len, 0x00);

    m_rows = rows;
    m_cols = cols;

    // a saved line from the old geometry can't be put back
    m_error_line  = rows;
    m_error_saved = false;
    m_error_save  = {};
    m_dirty       = true;
}


void
ScreenBuffer::clearAll()
{
    std::fill(m_chars.begin(),    m_chars.end(),    INIT_CHAR);
    std::fill(m_color.begin(),    m_color.end(),    INIT_ATTR);
    std::fill(m_extended.begin(), m_extended.end(), 0x00);
    std::fill(m_gui.begin(),      m_gui.end(),      0x00);
    m_error_saved = false;
    m_error_save  = {};
    m_dirty = true;
}


// ----------------------------------------------------------------------------
// plane access
// ----------------------------------------------------------------------------

void
ScreenBuffer::setChar(int pos, uint8 ch)
{
    assert(isValidPos(pos));
    m_chars[pos] = ch;
    m_dirty = true;
}


uint8
ScreenBuffer::getChar(int pos) const
{
    assert(isValidPos(pos));
    return m_chars[pos];
}


void
ScreenBuffer::setAttribute(int pos, int attr)
{
    assert(isValidPos(pos));

    // the plane holds a byte; the extended bits follow the stored code
    const uint8 code = static_cast<uint8>(attr);

    // a zero attribute is how the stream says "leave the cell alone"
    if (code == 0) {
        return;
    }

    m_color[pos]    = code;
    m_extended[pos] = disperseAttribute(code);
    m_dirty = true;
}


uint8
ScreenBuffer::getAttribute(int pos) const
{
    assert(isValidPos(pos));
    return m_color[pos];
}


uint8
ScreenBuffer::getExtended(int pos) const
{
    assert(isValidPos(pos));
    return m_extended[pos];
}


bool
ScreenBuffer::isUnderline(int pos) const
{
    return (getExtended(pos) & EXT_ATTR_UNDERLINE) != 0;
}


bool
ScreenBuffer::isColumnSeparator(int pos) const
{
    return (getExtended(pos) & EXT_ATTR_COL_SEP) != 0;
}


bool
ScreenBuffer::isNonDisplay(int pos) const
{
    return (getExtended(pos) & EXT_ATTR_NON_DSP) != 0;
}


void
ScreenBuffer::setGui(int pos, uint8 marker)
{
    assert(isValidPos(pos));
    m_gui[pos] = marker;
    m_dirty = true;
}


uint8
ScreenBuffer::getGui(int pos) const
{
    assert(isValidPos(pos));
    return m_gui[pos];
}


// map an attribute code to the extended plane bits it implies.
// codes without an entry, including anything outside 32..63, imply none.
uint8
ScreenBuffer::disperseAttribute(int attr) noexcept
{
    switch (attr) {
    case 36:    // green/underline
    case 37:    // green/reverse/underline
    case 38:    // white/underline
    case 44:    // red/underline
    case 45:    // red/reverse/underline
    case 46:    // red/blink/underline
    case 52:    // turquoise/underline
    case 53:    // turquoise/reverse/underline
    case 54:    // yellow/underline
    case 60:    // pink/underline
    case 61:    // pink/reverse/underline
    case 62:    // blue/underline
        return EXT_ATTR_UNDERLINE;

    case 48:    // turquoise/column separator
    case 49:    // turquoise/reverse/column separator
    case 50:    // yellow/column separator
    case 51:    // yellow/reverse/column separator
        return EXT_ATTR_COL_SEP;

    case 39:
    case 47:
    case 55:
    case 63:
        return EXT_ATTR_NON_DSP;

    default:
        return 0x00;
    }
}


const std::vector<uint8>&
ScreenBuffer::plane(plane_t which) const
{
    switch (which) {
    case PLANE_COLOR:    return m_color;
    case PLANE_EXTENDED: return m_extended;
    case PLANE_GUI:      return m_gui;
    case PLANE_TEXT:
    default:             return m_chars;
    }
}


std::vector<uint8>
ScreenBuffer::getPlaneData(int pos, int length, plane_t which) const
{
    std::vector<uint8> data;
    if (length <= 0) {
        return data;
    }

    const std::vector<uint8> &src = plane(which);
    const int first = std::max(pos, 0);
    const int last  = std::min(pos + length, getScreenLength());  // exclusive
    if (first < last) {
        data.assign(src.begin() + first, src.begin() + last);
    }
    return data;
}


std::vector<uint8>
ScreenBuffer::getData(int start_row, int start_col,
                      int end_row,   int end_col,
                      plane_t which) const
{
    std::vector<uint8> data;

    if (start_row < 0 || start_col < 0 ||
        end_row >= m_rows || end_col >= m_cols ||
        start_row > end_row || start_col > end_col) {
        return data;
    }

    const std::vector<uint8> &src = plane(which);
    const int width = end_col - start_col + 1;
    data.reserve(width * (end_row - start_row + 1));

    for (int row = start_row; row <= end_row; row++) {
        const int base = getPos(row, start_col);
        data.insert(data.end(), src.begin() + base, src.begin() + base + width);
    }
    return data;
}


std::string
ScreenBuffer::getScreenAsChars() const
{
    const int len = getScreenLength();
    std::string text(len, ' ');
    for (int pos = 0; pos < len; pos++) {
        const uint8 ch = m_chars[pos];
        if (ch != 0x00 && !(m_extended[pos] & EXT_ATTR_NON_DSP)) {
            text[pos] = static_cast<char>(ch);
        }
    }
    return text;
}


std::string
ScreenBuffer::getScreenAsAllChars() const
{
    return std::string(m_chars.begin(), m_chars.end());
}


// ----------------------------------------------------------------------------
// error line
// ----------------------------------------------------------------------------

void
ScreenBuffer::setErrorLineNum(int row) noexcept
{
    m_error_line = (row >= 1 && row <= m_rows) ? row : m_rows;
}


// snapshot the error line.  while a snapshot is held, later saves are
// ignored so that stacked error messages still restore the first saved row.
void
ScreenBuffer::saveErrorLine()
{
    if (m_error_saved) {
        return;
    }

    const int base = getPos(m_error_line - 1, 0);
    m_error_save.chars.assign(   m_chars.begin()    + base, m_chars.begin()    + base + m_cols);
    m_error_save.color.assign(   m_color.begin()    + base, m_color.begin()    + base + m_cols);
    m_error_save.extended.assign(m_extended.begin() + base, m_extended.begin() + base + m_cols);
    m_error_save.gui.assign(     m_gui.begin()      + base, m_gui.begin()      + base + m_cols);
    m_error_saved = true;
}


void
ScreenBuffer::restoreErrorLine()
{
    if (!m_error_saved) {
        return;
    }

    const int base = getPos(m_error_line - 1, 0);
    for (int col = 0; col < m_cols; col++) {
        m_chars[base + col]    = m_error_save.chars[col];
        m_color[base + col]    = m_error_save.color[col];
        m_extended[base + col] = m_error_save.extended[col];
        m_gui[base + col]      = m_error_save.gui[col];
    }

    m_error_saved = false;
    m_error_save  = {};
    m_dirty       = true;
}

// vim: ts=8:et:sw=4:smarttab
