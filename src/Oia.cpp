// This file implements the Oia class.

#include "Oia.h"

// ----------------------------------------------------------------------------
// Oia
// ----------------------------------------------------------------------------

Oia::Oia() :
    m_next_handle(1),
    m_kb_locked(false),
    m_keys_buffered(false),
    m_insert_mode(false),
    m_inhibit(INPUTINHIBITED_NOTINHIBITED),
    m_inhibit_code(0),
    m_comm_check(0),
    m_machine_check(0),
    m_has_text(false),
    m_message_light(false),
    m_script_active(false),
    m_owner(0),
    m_level(OIA_CHANGED_NONE)
{
}


int
Oia::addListener(const oiaCallback &cb)
{
    assert(cb);
    const int handle = m_next_handle++;
    listener_t listener = { handle, cb };
    m_listeners.push_back(listener);
    return handle;
}


bool
Oia::removeListener(int handle)
{
    for (auto it = begin(m_listeners); it != end(m_listeners); ++it) {
        if (it->handle == handle) {
            m_listeners.erase(it);
            return true;
        }
    }
    dbglog("Oia: attempt to remove unknown listener %d\n", handle);
    return false;
}


// a callback may add or remove listeners, so walk a copy of the list
void
Oia::fireOiaChanged(oia_change_t change)
{
    m_level = change;
    const std::vector<listener_t> listeners(m_listeners);
    for (auto &listener : listeners) {
        listener.callback_fn(*this, change);
    }
}


// ----------------------------------------------------------------------------
// state setters
// ----------------------------------------------------------------------------

void
Oia::setKeyboardLocked(bool locked)
{
    if (locked == m_kb_locked) {
        return;
    }
    m_kb_locked = locked;
    fireOiaChanged(OIA_CHANGED_KEYBOARD_LOCKED);
}


void
Oia::setKeysBuffered(bool buffered)
{
    if (buffered == m_keys_buffered) {
        return;
    }
    m_keys_buffered = buffered;
    fireOiaChanged(OIA_CHANGED_KEYS_BUFFERED);
}


void
Oia::setInsertMode(bool insert)
{
    if (insert == m_insert_mode) {
        return;
    }
    m_insert_mode = insert;
    fireOiaChanged(OIA_CHANGED_INSERT_MODE);
}


void
Oia::setInputInhibited(inhibit_t code, int what_code)
{
    if (code == m_inhibit && what_code == m_inhibit_code && !m_has_text) {
        return;
    }

    m_inhibit      = code;
    m_inhibit_code = what_code;
    m_has_text     = false;
    m_inhibit_text.clear();

    if (code == INPUTINHIBITED_COMMCHECK) {
        m_comm_check = what_code;
    } else if (code == INPUTINHIBITED_MACHINECHECK) {
        m_machine_check = what_code;
    }

    fireOiaChanged(OIA_CHANGED_INPUTINHIBITED);
}


void
Oia::setInputInhibited(inhibit_t code, int what_code, const std::string &message)
{
    if (code == m_inhibit && what_code == m_inhibit_code &&
        m_has_text && message == m_inhibit_text) {
        return;
    }

    m_inhibit      = code;
    m_inhibit_code = what_code;
    m_has_text     = true;
    m_inhibit_text = message;

    if (code == INPUTINHIBITED_COMMCHECK) {
        m_comm_check = what_code;
    } else if (code == INPUTINHIBITED_MACHINECHECK) {
        m_machine_check = what_code;
    }

    fireOiaChanged(OIA_CHANGED_INPUTINHIBITED);
}


bool
Oia::isErrorInhibit() const noexcept
{
    return (m_inhibit == INPUTINHIBITED_COMMCHECK)
        || (m_inhibit == INPUTINHIBITED_PROGCHECK)
        || (m_inhibit == INPUTINHIBITED_MACHINECHECK)
        || (m_inhibit == INPUTINHIBITED_OTHER);
}


void
Oia::setMessageLightOn()
{
    if (m_message_light) {
        return;
    }
    m_message_light = true;
    fireOiaChanged(OIA_CHANGED_MESSAGELIGHT);
}


void
Oia::setMessageLightOff()
{
    if (!m_message_light) {
        return;
    }
    m_message_light = false;
    fireOiaChanged(OIA_CHANGED_MESSAGELIGHT);
}


void
Oia::setScriptActive(bool active)
{
    if (active == m_script_active) {
        return;
    }
    m_script_active = active;
    fireOiaChanged(OIA_CHANGED_SCRIPT);
}


// ----------------------------------------------------------------------------
// events
// ----------------------------------------------------------------------------

void
Oia::setAudibleBell()
{
    fireOiaChanged(OIA_CHANGED_BELL);
}


void
Oia::clearScreen()
{
    fireOiaChanged(OIA_CHANGED_CLEAR_SCREEN);
}


void
Oia::screenSizeChanged()
{
    fireOiaChanged(OIA_CHANGED_SCREEN_SIZE);
}

// vim: ts=8:et:sw=4:smarttab
