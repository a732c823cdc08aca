// This file implements the Session5250 class.
// It ties the pieces of the display model together:
//    applying host orders to the screen, format table, cursor and OIA
//    editing field contents as the operator types
//    enforcing the field rules: protected areas, numeric only, insert room
//    posting operator errors on the error line
//    buffering keystrokes typed while the keyboard is locked
//    building and sending the response to an attention key

#include "Session5250.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>

const int Session5250::ERR_PROTECTED_AREA;
const int Session5250::ERR_DIGITS_ONLY;
const int Session5250::ERR_NUMERIC_ONLY;
const int Session5250::ERR_NO_ROOM;

// display attribute used to write operator error messages: green, reverse
static const int ERROR_MSG_ATTR = 33;

// ----------------------------------------------------------------------------
// Session5250
// ----------------------------------------------------------------------------

Session5250::Session5250(const SessionCfgState &cfg, const hostCallback &to_host) :
    m_cfg(cfg),
    m_to_host(to_host),
    m_screen(PRIMARY_ROWS, PRIMARY_COLS),
    m_oia(),
    m_fields(m_screen),
    m_cursor(m_screen, m_oia, m_fields),
    m_aid(m_screen, m_fields, m_oia),
    m_oia_handle(0)
{
    m_aid.setResponseFormat(m_cfg.getResponseFormat());
    m_screen.setErrorLineNum(m_cfg.getErrorLine());

    m_oia_handle = m_oia.addListener(
        std::bind(&Session5250::oiaChanged, this,
                  std::placeholders::_1, std::placeholders::_2)
    );
}


// free resources on destruction
Session5250::~Session5250()
{
    m_oia.removeListener(m_oia_handle);
}


bool
Session5250::setConfig(const SessionCfgState &cfg)
{
    if (!cfg.configOk(true)) {
        return false;
    }

    const bool reset = cfg.needsReset(m_cfg);
    m_cfg = cfg;
    m_aid.setResponseFormat(m_cfg.getResponseFormat());

    if (reset) {
        clearUnit();
    } else {
        m_screen.setErrorLineNum(m_cfg.getErrorLine());
    }
    return true;
}


// ----------------------------------------------------------------------------
// orders from the host
// ----------------------------------------------------------------------------

void
Session5250::setGeometry(int rows, int cols)
{
    if (rows == m_screen.getRows() && cols == m_screen.getCols()) {
        return;
    }
    m_screen.resize(rows, cols);
    m_oia.screenSizeChanged();
}


void
Session5250::clearDisplay()
{
    m_screen.clearAll();
    m_screen.setErrorLineNum(m_cfg.getErrorLine());
    m_fields.clear();
    m_cursor.setAddress(0);

    // the error message went with the old screen
    if (m_oia.isErrorInhibit()) {
        m_oia.setInputInhibited(INPUTINHIBITED_NOTINHIBITED, 0);
    }
    m_oia.clearScreen();
}


void
Session5250::clearUnit()
{
#if TRACE_ORDERS
    dbglog("Session5250: clear unit\n");
#endif
    setGeometry(PRIMARY_ROWS, PRIMARY_COLS);
    clearDisplay();
}


bool
Session5250::clearUnitAlternate()
{
#if TRACE_ORDERS
    dbglog("Session5250: clear unit alternate\n");
#endif
    if (m_cfg.getScreenSize() != SCREEN_27x132) {
        dbglog("Session5250: clear unit alternate on a 24x80 device ignored\n");
        return false;
    }
    setGeometry(ALTERNATE_ROWS, ALTERNATE_COLS);
    clearDisplay();
    return true;
}


void
Session5250::clearFormatTable()
{
#if TRACE_ORDERS
    dbglog("Session5250: clear format table\n");
#endif
    m_fields.clear();
}


bool
Session5250::processSetBufferAddress(int row, int col)
{
#if TRACE_ORDERS
    dbglog("Session5250: SBA row=%d, col=%d\n", row, col);
#endif
    if (!m_cursor.processSetBufferAddress(row, col)) {
        return false;
    }
    syncCurrentField();
    return true;
}


bool
Session5250::startField(int attr, int length, int ffw1, int ffw2, int fcw1, int fcw2)
{
    const int pos = m_cursor.getPosition();
#if TRACE_ORDERS
    dbglog("Session5250: SF at %d, attr=%d, len=%d, ffw=%02x%02x, fcw=%02x%02x\n",
           pos, attr, length, ffw1, ffw2, fcw1, fcw2);
#endif
    if (!m_screen.isValidPos(pos)) {
        dbglog("Session5250: SF at invalid position %d ignored\n", pos);
        return false;
    }

    ScreenField *field = m_fields.addField(pos, attr, length, ffw1, ffw2, fcw1, fcw2);

    // cells past the end of the buffer have no attribute to set
    const int last = std::min(field->endPos(), m_screen.getScreenLength() - 1);
    for (int p = field->startPos(); p <= last; p++) {
        m_screen.setAttribute(p, attr);
    }
    return true;
}


bool
Session5250::writeToDisplay(const std::string &text)
{
    int pos = m_cursor.getPosition();
#if TRACE_ORDERS
    dbglog("Session5250: WTD at %d, %d bytes\n", pos, static_cast<int>(text.size()));
#endif
    if (!m_screen.isValidPos(pos)) {
        dbglog("Session5250: WTD at invalid position %d ignored\n", pos);
        return false;
    }

    const int len = m_screen.getScreenLength();
    for (const char ch : text) {
        m_screen.setChar(pos, static_cast<uint8>(ch));
        pos = (pos + 1) % len;
    }
    m_cursor.setAddress(pos);
    return true;
}


bool
Session5250::writeAttribute(int attr)
{
    const int pos = m_cursor.getPosition();
    if (!m_screen.isValidPos(pos)) {
        dbglog("Session5250: attribute at invalid position %d ignored\n", pos);
        return false;
    }

    m_screen.setAttribute(pos, attr);
    m_cursor.setAddress((pos + 1) % m_screen.getScreenLength());
    return true;
}


bool
Session5250::insertCursor(int row, int col)
{
#if TRACE_ORDERS
    dbglog("Session5250: IC row=%d, col=%d\n", row, col);
#endif
    if (!m_cursor.processSetBufferAddress(row, col)) {
        return false;
    }
    m_cursor.setCursorOn();
    syncCurrentField();
    return true;
}


void
Session5250::lockKeyboard()
{
    m_oia.setKeyboardLocked(true);
}


void
Session5250::unlockKeyboard()
{
    // the host answered; the wait is over
    if (m_oia.getInputInhibited() == INPUTINHIBITED_SYSTEM_WAIT) {
        m_oia.setInputInhibited(INPUTINHIBITED_NOTINHIBITED, 0);
    }
    m_oia.setKeyboardLocked(false);
}


void
Session5250::setMessageLight(bool on)
{
    if (on) {
        m_oia.setMessageLightOn();
    } else {
        m_oia.setMessageLightOff();
    }
}


void
Session5250::soundBell()
{
    m_oia.setAudibleBell();
}


// ----------------------------------------------------------------------------
// operator input
// ----------------------------------------------------------------------------

void
Session5250::syncCurrentField()
{
    m_fields.setCurrentField(m_fields.findByPosition(m_cursor.getPosition()));
}


bool
Session5250::moveCursor(int pos)
{
    if (!m_cursor.moveCursor(pos)) {
        return false;
    }
    syncCurrentField();
    return true;
}


bool
Session5250::gotoField(int index)
{
    return m_cursor.gotoField(index);
}


bool
Session5250::fieldAdvance()
{
    if (m_oia.isKeyBoardLocked()) {
        return false;
    }

    syncCurrentField();
    const ScreenField *field = m_fields.gotoFieldNext();
    if (!field) {
        return false;
    }
    return m_cursor.moveCursor(field->startPos());
}


// go to the start of the current field, or if already there,
// to the start of the previous input field
bool
Session5250::fieldBackspace()
{
    if (m_oia.isKeyBoardLocked()) {
        return false;
    }

    syncCurrentField();
    const ScreenField *field = m_fields.getCurrentField();
    if (!field || field->isBypassField() ||
        m_cursor.getPosition() == field->startPos()) {
        field = m_fields.gotoFieldPrev();
        if (!field) {
            return false;
        }
    }
    return m_cursor.moveCursor(field->startPos());
}


void
Session5250::toggleInsertMode()
{
    m_oia.setInsertMode(!m_oia.isInsertMode());
}


bool
Session5250::typeText(const std::string &text)
{
    for (size_t n = 0; n < text.size(); n++) {
        if (m_oia.isKeyBoardLocked()) {
            if (!m_cfg.getTypeAhead()) {
#if TRACE_INPUT_ERRORS
                dbglog("Session5250: keyboard locked, %d keys dropped\n",
                       static_cast<int>(text.size() - n));
#endif
                return false;
            }
            for (size_t k = n; k < text.size(); k++) {
                m_kb_buff.push(static_cast<uint8>(text[k]));
            }
            m_oia.setKeysBuffered(true);
            return true;
        }

        if (!typeChar(static_cast<uint8>(text[n]))) {
            return false;
        }
    }
    return true;
}


bool
Session5250::typeChar(uint8 ch)
{
    if (m_oia.isErrorInhibit()) {
#if TRACE_INPUT_ERRORS
        dbglog("Session5250: key 0x%02x refused until the error is reset\n", ch);
#endif
        return false;
    }

    const int pos = m_cursor.getPosition();
    ScreenField *field = m_fields.findByPosition(pos);
    m_fields.setCurrentField(field);

    if (!field || field->isBypassField() || !m_screen.isValidPos(pos)) {
        operatorError(ERR_PROTECTED_AREA, "Cursor in protected area of display.");
        return false;
    }

    if (field->isSignedNumeric() && !isdigit(ch)) {
        operatorError(ERR_DIGITS_ONLY, "Field requires numeric characters.");
        return false;
    }
    if (field->isNumeric() && !isdigit(ch) && (strchr("+-,. ", ch) == nullptr || ch == 0)) {
        operatorError(ERR_NUMERIC_ONLY,
                      "Enter only characters 0 through 9, comma, period, minus, plus, or blank.");
        return false;
    }

    if (field->isToUpper() && ch < 0x80) {
        ch = static_cast<uint8>(toupper(ch));
    }

    // the last cell may extend past the buffer; type only into what exists
    const int end = std::min(field->endPos(), m_screen.getScreenLength() - 1);

    if (m_oia.isInsertMode()) {
        if (m_screen.getChar(end) != 0x00) {
            operatorError(ERR_NO_ROOM, "No room to insert data.");
            return false;
        }
        for (int p = end; p > pos; p--) {
            m_screen.setChar(p, m_screen.getChar(p-1));
        }
    }

    m_screen.setChar(pos, ch);
    field->setMDT();

    if (pos < end) {
        return m_cursor.moveCursor(pos + 1);
    }

    fieldFull(*field);
    return true;
}


void
Session5250::fieldFull(const ScreenField &field)
{
    // field exit required: the cursor waits on the last cell
    if (field.isFER()) {
        return;
    }

    const bool ok = (field.isAutoEnter())
                  ? sendAid(AidResponseBuilder::AID_ENTER, FIELDS_MODIFIED, true)
                  : fieldAdvance();
    if (!ok) {
        dbglog("Session5250: leaving full field %d failed\n", field.getIndex()+1);
    }
}


void
Session5250::operatorError(int code, const std::string &message)
{
#if TRACE_INPUT_ERRORS
    dbglog("Session5250: operator error %04d at %d: %s\n",
           code, m_cursor.getPosition(), message.c_str());
#endif

    m_screen.saveErrorLine();

    char code_str[8];
    snprintf(&code_str[0], sizeof(code_str), "%04d ", code);
    const std::string line = std::string(&code_str[0]) + message;

    const int cols = m_screen.getCols();
    const int base = m_screen.getPos(m_screen.getErrorLineNum() - 1, 0);
    for (int col = 0; col < cols; col++) {
        const uint8 ch = (col < static_cast<int>(line.size()))
                       ? static_cast<uint8>(line[col]) : 0x00;
        m_screen.setChar(base + col, ch);
        m_screen.setAttribute(base + col, ERROR_MSG_ATTR);
    }

    m_oia.setInputInhibited(INPUTINHIBITED_OTHER, code, message);
    m_oia.setAudibleBell();
}


bool
Session5250::resetError()
{
    if (!m_oia.isErrorInhibit()) {
        return false;
    }
    m_screen.restoreErrorLine();
    m_oia.setInputInhibited(INPUTINHIBITED_NOTINHIBITED, 0);
    return true;
}


bool
Session5250::sendAid(uint8 aid, field_mode_t mode, bool include_cursor)
{
    if (m_oia.isKeyBoardLocked()) {
#if TRACE_INPUT_ERRORS
        dbglog("Session5250: keyboard locked, AID 0x%02x refused\n", aid);
#endif
        return false;
    }

    const std::vector<uint8> resp = m_aid.buildResponse(aid, m_cursor, mode, include_cursor);

    // wait for the host to answer.  the host may answer from inside
    // the callback, so the lock has to be in place before it runs.
    m_oia.setInputInhibited(INPUTINHIBITED_SYSTEM_WAIT, 0);
    m_oia.setKeyboardLocked(true);
    if (m_to_host) {
        m_to_host(resp);
    }
    return true;
}


// ----------------------------------------------------------------------------
// type-ahead
// ----------------------------------------------------------------------------

void
Session5250::flushTypeAhead()
{
    std::string keys;
    while (!m_kb_buff.empty()) {
        keys.push_back(static_cast<char>(m_kb_buff.front()));
        m_kb_buff.pop();
    }
    m_oia.setKeysBuffered(false);
    if (!typeText(keys)) {
        dbglog("Session5250: type-ahead stopped by an input error\n");
    }
}


void
Session5250::oiaChanged(const Oia &oia, oia_change_t change)
{
    if (change == OIA_CHANGED_KEYBOARD_LOCKED &&
        !oia.isKeyBoardLocked() && !m_kb_buff.empty()) {
        flushTypeAhead();
    }
}

// vim: ts=8:et:sw=4:smarttab
