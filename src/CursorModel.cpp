// This file implements the CursorModel class.

#include "CursorModel.h"
#include "FieldTable.h"
#include "Oia.h"
#include "ScreenBuffer.h"

// ----------------------------------------------------------------------------
// CursorModel
// ----------------------------------------------------------------------------

CursorModel::CursorModel(const ScreenBuffer &screen, const Oia &oia,
                         FieldTable &fields) :
    m_screen(screen),
    m_oia(oia),
    m_fields(fields),
    m_pos(0),
    m_active(true),
    m_visible(true)
{
}


void
CursorModel::setCursor(int row, int col) noexcept
{
    m_pos = (row - 1) * m_screen.getCols() + (col - 1);
}


bool
CursorModel::moveCursor(int pos)
{
    if (m_oia.isKeyBoardLocked()) {
#if TRACE_INPUT_ERRORS
        dbglog("CursorModel: keyboard locked, move to %d refused\n", pos);
#endif
        return false;
    }

    if (!m_screen.isValidPos(pos)) {
#if TRACE_INPUT_ERRORS
        dbglog("CursorModel: move to %d is outside the %d cell buffer\n",
               pos, m_screen.getScreenLength());
#endif
        return false;
    }

    m_pos = pos;
    return true;
}


bool
CursorModel::processSetBufferAddress(int row, int col)
{
    if (row < 1 || row > m_screen.getRows() ||
        col < 1 || col > m_screen.getCols()) {
        dbglog("CursorModel: SBA row=%d, col=%d is outside the %dx%d display\n",
               row, col, m_screen.getRows(), m_screen.getCols());
        return false;
    }

    setCursor(row, col);
    return true;
}


bool
CursorModel::gotoField(int index)
{
    if (index <= 0 || index > m_fields.getFieldCount()) {
        dbglog("CursorModel: no field %d (%d defined)\n",
               index, m_fields.getFieldCount());
        return false;
    }

    ScreenField *field = m_fields.getField(index - 1);
    assert(field != nullptr);
    if (!moveCursor(field->startPos())) {
        return false;
    }

    m_fields.setCurrentField(field);
    return true;
}


void
CursorModel::setAddress(int pos) noexcept
{
    assert(m_screen.isValidPos(pos));
    m_pos = pos;
}


int
CursorModel::getCurrentRow() const noexcept
{
    return (m_pos / m_screen.getCols()) + 1;
}


int
CursorModel::getCurrentCol() const noexcept
{
    return (m_pos % m_screen.getCols()) + 1;
}

// vim: ts=8:et:sw=4:smarttab
