// The Oia class models the operator information area of a 5250 display:
// the row of indicators telling the operator whether the keyboard is
// usable and why not.
//
// Anything that draws the indicators, or cares about them changing,
// registers a callback.  Each setter that actually changes state invokes
// every callback, in registration order, with the category of the change.
// Setting a value to what it already is does nothing at all.  The bell,
// clear screen and screen size notifications are events rather than state,
// so they always go out.

#ifndef _INCLUDE_OIA_H_
#define _INCLUDE_OIA_H_

#include "w5250.h"

// which part of the OIA changed
enum oia_change_t {
    OIA_CHANGED_NONE,
    OIA_CHANGED_KEYBOARD_LOCKED,
    OIA_CHANGED_INSERT_MODE,
    OIA_CHANGED_INPUTINHIBITED,
    OIA_CHANGED_MESSAGELIGHT,
    OIA_CHANGED_KEYS_BUFFERED,
    OIA_CHANGED_SCRIPT,
    OIA_CHANGED_BELL,
    OIA_CHANGED_CLEAR_SCREEN,
    OIA_CHANGED_SCREEN_SIZE
};

// why input is inhibited
enum inhibit_t {
    INPUTINHIBITED_NOTINHIBITED,
    INPUTINHIBITED_SYSTEM_WAIT,
    INPUTINHIBITED_COMMCHECK,
    INPUTINHIBITED_PROGCHECK,
    INPUTINHIBITED_MACHINECHECK,
    INPUTINHIBITED_OTHER
};

class Oia;
using oiaCallback = std::function<void(const Oia &oia, oia_change_t change)>;

class Oia
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(Oia);

    Oia();
    ~Oia() = default;

    // ---- listeners ----

    // returns a handle for removeListener()
    int  addListener(const oiaCallback &cb);
    bool removeListener(int handle);

    // ---- keyboard ----
    void setKeyboardLocked(bool locked);
    bool isKeyBoardLocked() const noexcept { return m_kb_locked; }

    void setKeysBuffered(bool buffered);
    bool isKeysBuffered() const noexcept { return m_keys_buffered; }

    void setInsertMode(bool insert);
    bool isInsertMode() const noexcept { return m_insert_mode; }

    // ---- input inhibit ----

    // what_code is kept as the comm check or machine check code when the
    // reason is one of those, and as the error code in every case.
    void setInputInhibited(inhibit_t code, int what_code);
    // as above, with a message for the operator.  the text is kept verbatim.
    void setInputInhibited(inhibit_t code, int what_code, const std::string &message);

    inhibit_t getInputInhibited() const noexcept { return m_inhibit; }
    int  getInhibitCode()      const noexcept { return m_inhibit_code; }
    int  getCommCheckCode()    const noexcept { return m_comm_check; }
    int  getMachineCheckCode() const noexcept { return m_machine_check; }
    int  getProgCheckCode()    const noexcept { return 0; }

    // a message accompanies the inhibit
    bool hasInhibitedText() const noexcept { return m_has_text; }
    // the message, or an empty string
    const std::string& getInhibitedText() const noexcept { return m_inhibit_text; }

    // true for the inhibits that only the operator or an attention key clear
    bool isErrorInhibit() const noexcept;

    // ---- message waiting ----
    void setMessageLightOn();
    void setMessageLightOff();
    bool isMessageWait() const noexcept { return m_message_light; }

    // ---- scripting ----
    void setScriptActive(bool active);
    bool isScriptActive() const noexcept { return m_script_active; }

    // ---- events ----
    void setAudibleBell();
    void clearScreen();
    void screenSizeChanged();

    // ---- miscellaneous ----
    void setOwner(int owner) noexcept { m_owner = owner; }
    int  getOwner() const noexcept { return m_owner; }

    // the category of the most recent notification
    oia_change_t getLevel() const noexcept { return m_level; }

private:
    void fireOiaChanged(oia_change_t change);

    struct listener_t {
        int         handle;
        oiaCallback callback_fn;
    };

    std::vector<listener_t> m_listeners;
    int          m_next_handle;

    bool         m_kb_locked;
    bool         m_keys_buffered;
    bool         m_insert_mode;
    inhibit_t    m_inhibit;
    int          m_inhibit_code;
    int          m_comm_check;
    int          m_machine_check;
    bool         m_has_text;
    std::string  m_inhibit_text;
    bool         m_message_light;
    bool         m_script_active;
    int          m_owner;
    oia_change_t m_level;
};

#endif // _INCLUDE_OIA_H_

// vim: ts=8:et:sw=4:smarttab
