// This class models one 5250 display session.  It owns the screen buffer,
// field table, cursor and operator information area, and applies the two
// streams that drive them:
//
//    - orders from the host, already decoded from the data stream
//    - operator input: cursor movement, typing, and attention keys
//
// The bytes generated by an attention key are handed to a callback, which
// is expected to frame them and send them to the host.

#ifndef _INCLUDE_SESSION5250_H_
#define _INCLUDE_SESSION5250_H_

#include "AidResponse.h"
#include "CursorModel.h"
#include "FieldTable.h"
#include "Oia.h"
#include "ScreenBuffer.h"
#include "SessionCfgState.h"
#include "w5250.h"

#include <queue>

using hostCallback = std::function<void(const std::vector<uint8> &bytes)>;

class Session5250
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(Session5250);

    Session5250(const SessionCfgState &cfg, const hostCallback &to_host);
    ~Session5250();

    // operator error codes shown on the error line
    static const int ERR_PROTECTED_AREA = 5;   // typing outside an input field
    static const int ERR_DIGITS_ONLY    = 9;   // signed numeric field
    static const int ERR_NUMERIC_ONLY   = 10;  // numeric field
    static const int ERR_NO_ROOM        = 12;  // insert into a full field

    // apply new settings.  returns false, changing nothing, if the
    // configuration is not valid.
    bool setConfig(const SessionCfgState &cfg);
    const SessionCfgState& getConfig() const noexcept { return m_cfg; }

    ScreenBuffer&       screen()       noexcept { return m_screen; }
    const ScreenBuffer& screen() const noexcept { return m_screen; }
    FieldTable&         fields()       noexcept { return m_fields; }
    const FieldTable&   fields() const noexcept { return m_fields; }
    CursorModel&        cursor()       noexcept { return m_cursor; }
    const CursorModel&  cursor() const noexcept { return m_cursor; }
    Oia&                oia()          noexcept { return m_oia; }
    const Oia&          oia()    const noexcept { return m_oia; }

    // ---- orders from the host ----

    // clear the display and the format table, selecting the 24x80 geometry
    void clearUnit();
    // as above, selecting 27x132.  refused on a 24x80 device.
    bool clearUnitAlternate();
    void clearFormatTable();
    bool processSetBufferAddress(int row, int col);
    // define a field at the cursor, giving its cells the field attribute
    bool startField(int attr, int length, int ffw1, int ffw2, int fcw1, int fcw2);
    // put text at the cursor and step past it, wrapping at the buffer end
    bool writeToDisplay(const std::string &text);
    bool writeAttribute(int attr);
    bool insertCursor(int row, int col);
    void lockKeyboard();
    void unlockKeyboard();
    void setMessageLight(bool on);
    void soundBell();

    // ---- operator input ----
    bool moveCursor(int pos);
    bool gotoField(int index);
    bool fieldAdvance();
    bool fieldBackspace();
    bool typeText(const std::string &text);
    void toggleInsertMode();
    // the Reset key: leave an operator error
    bool resetError();
    // an attention key; on success the keyboard stays locked until the
    // host unlocks it
    bool sendAid(uint8 aid, field_mode_t mode, bool include_cursor);

    // number of keystrokes waiting for the keyboard to unlock
    int  getTypeAheadCount() const noexcept
        { return static_cast<int>(m_kb_buff.size()); }

private:
    // make the field under the cursor, if any, current
    void syncCurrentField();

    // switch display geometry, notifying the OIA if it changes
    void setGeometry(int rows, int cols);

    // clear the display and format, leaving the geometry alone
    void clearDisplay();

    // process one keystroke of typeText()
    bool typeChar(uint8 ch);

    // the cursor ran off the end of the current field
    void fieldFull(const ScreenField &field);

    // post an operator error: message on the error line, input inhibited
    void operatorError(int code, const std::string &message);

    // replay the keys typed while the keyboard was locked
    void flushTypeAhead();

    // OIA listener
    void oiaChanged(const Oia &oia, oia_change_t change);

    SessionCfgState    m_cfg;
    hostCallback       m_to_host;

    // the order matters: later members hold references to earlier ones
    ScreenBuffer       m_screen;
    Oia                m_oia;
    FieldTable         m_fields;
    CursorModel        m_cursor;
    AidResponseBuilder m_aid;

    int                m_oia_handle;    // our listener registration
    std::queue<uint8>  m_kb_buff;       // keys typed while locked
};

#endif // _INCLUDE_SESSION5250_H_

// vim: ts=8:et:sw=4:smarttab
