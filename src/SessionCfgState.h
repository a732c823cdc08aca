// This class holds the configuration state of one 5250 display session.
//
// It allows the caller to:
//    + set the state to some reasonable default
//    + read the state from the ini file
//    + save the state to the ini file
//    + copy state
//    + compare the state of two configurations
//    + report if the state is valid
//    + report if the transition between two sets of state requires the
//      session to be reset, or just a soft state change

#ifndef _INCLUDE_SESSION_CFG_STATE_H_
#define _INCLUDE_SESSION_CFG_STATE_H_

#include "AidResponse.h"        // for response_format_t
#include "w5250.h"

// display geometry of the emulated device
enum screen_size_t {
    SCREEN_24x80,       // primary size only
    SCREEN_27x132       // also supports the alternate size
};

class SessionCfgState
{
public:
    SessionCfgState();
    SessionCfgState(const SessionCfgState &obj) noexcept;             // copy
    SessionCfgState &operator=(const SessionCfgState &rhs) noexcept;  // assign

    // establish a reasonable default state
    void setDefaults() noexcept;

    // load/save a configuration from/to the .ini file
    void loadIni(const std::string &subgroup);
    void saveIni(const std::string &subgroup) const;

    bool operator==(const SessionCfgState &rhs) const noexcept;
    bool operator!=(const SessionCfgState &rhs) const noexcept;

    // returns true if the current configuration is valid.
    // if warn is true, problems are reported via dbglog().
    bool configOk(bool warn) const;

    // returns true if moving from other to this needs a session reset
    bool needsReset(const SessionCfgState &other) const noexcept;

    // ------------ settings ------------

    void setScreenSize(screen_size_t size) noexcept;
    screen_size_t getScreenSize() const noexcept;

    void setResponseFormat(response_format_t format) noexcept;
    response_format_t getResponseFormat() const noexcept;

    // 1-based row of the error line; 0 means the last row
    void setErrorLine(int row) noexcept;
    int  getErrorLine() const noexcept;

    // buffer keys typed while the keyboard is locked
    void setTypeAhead(bool enable) noexcept;
    bool getTypeAhead() const noexcept;

private:
    // just for debugging -- make sure we don't attempt to use such a config
    bool              m_initialized;

    screen_size_t     m_screen_size;
    response_format_t m_response_format;
    int               m_error_line;
    bool              m_type_ahead;
};

#endif // _INCLUDE_SESSION_CFG_STATE_H_

// vim: ts=8:et:sw=4:smarttab
