#include "SessionCfgState.h"
#include "host.h"

// ------------------------------------------------------------------------
// public members
// ------------------------------------------------------------------------

SessionCfgState::SessionCfgState() :
    m_initialized(false),
    m_screen_size(SCREEN_24x80),
    m_response_format(RESPONSE_LONG),
    m_error_line(0),
    m_type_ahead(true)
{
}


// assignment
SessionCfgState&
SessionCfgState::operator=(const SessionCfgState &rhs) noexcept
{
    // don't copy something that hasn't been initialized
    assert(rhs.m_initialized);

    // check for self-assignment
    if (this != &rhs) {
        m_screen_size     = rhs.m_screen_size;
        m_response_format = rhs.m_response_format;
        m_error_line      = rhs.m_error_line;
        m_type_ahead      = rhs.m_type_ahead;
        m_initialized     = true;
    }

    return *this;
}


// copy constructor
SessionCfgState::SessionCfgState(const SessionCfgState &obj) noexcept
{
    assert(obj.m_initialized);
    m_screen_size     = obj.m_screen_size;
    m_response_format = obj.m_response_format;
    m_error_line      = obj.m_error_line;
    m_type_ahead      = obj.m_type_ahead;
    m_initialized     = true;
}


// equality comparison
bool
SessionCfgState::operator==(const SessionCfgState &rhs) const noexcept
{
    assert(    m_initialized);
    assert(rhs.m_initialized);

    return (getScreenSize()     == rhs.getScreenSize())
        && (getResponseFormat() == rhs.getResponseFormat())
        && (getErrorLine()      == rhs.getErrorLine())
        && (getTypeAhead()      == rhs.getTypeAhead());
}


bool
SessionCfgState::operator!=(const SessionCfgState &rhs) const noexcept
{
    return !(*this == rhs);
}


void
SessionCfgState::setDefaults() noexcept
{
    setScreenSize(SCREEN_24x80);
    setResponseFormat(RESPONSE_LONG);
    setErrorLine(0);
    setTypeAhead(true);
}


// read from configuration file
void
SessionCfgState::loadIni(const std::string &subgroup)
{
    setDefaults();

    std::string sval;
    const std::string default_size("24x80");
    host::configReadStr(subgroup, "screenSize", &sval, &default_size);
    if (sval == "24x80") {
        setScreenSize(SCREEN_24x80);
    } else if (sval == "27x132") {
        setScreenSize(SCREEN_27x132);
    } else {
        dbglog("SessionCfgState: bad screenSize '%s' -- assuming 24x80\n",
               sval.c_str());
    }

    const std::string default_format("long");
    host::configReadStr(subgroup, "responseFormat", &sval, &default_format);
    if (sval == "long") {
        setResponseFormat(RESPONSE_LONG);
    } else if (sval == "structured") {
        setResponseFormat(RESPONSE_STRUCTURED);
    } else {
        dbglog("SessionCfgState: bad responseFormat '%s' -- assuming long\n",
               sval.c_str());
    }

    // the row limit depends on the screen size just read
    const int max_row = (getScreenSize() == SCREEN_27x132) ? ALTERNATE_ROWS
                                                           : PRIMARY_ROWS;
    int ival;
    host::configReadInt(subgroup, "errorLine", &ival, 0);
    if (ival < 0 || ival > max_row) {
        dbglog("SessionCfgState: bad errorLine %d -- using the last row\n", ival);
        ival = 0;
    }
    setErrorLine(ival);

    bool bval;
    host::configReadBool(subgroup, "typeAhead", &bval, true);
    setTypeAhead(bval);
}


// save to configuration file
void
SessionCfgState::saveIni(const std::string &subgroup) const
{
    assert(m_initialized);
    host::configWriteStr(subgroup, "screenSize",
                         (getScreenSize() == SCREEN_27x132) ? "27x132" : "24x80");
    host::configWriteStr(subgroup, "responseFormat",
                         (getResponseFormat() == RESPONSE_STRUCTURED) ? "structured" : "long");
    host::configWriteInt(subgroup, "errorLine", getErrorLine());
    host::configWriteBool(subgroup, "typeAhead", getTypeAhead());
}


void
SessionCfgState::setScreenSize(screen_size_t size) noexcept
{
    m_screen_size = size;
    m_initialized = true;
}


screen_size_t
SessionCfgState::getScreenSize() const noexcept
{
    return m_screen_size;
}


void
SessionCfgState::setResponseFormat(response_format_t format) noexcept
{
    m_response_format = format;
    m_initialized = true;
}


response_format_t
SessionCfgState::getResponseFormat() const noexcept
{
    return m_response_format;
}


void
SessionCfgState::setErrorLine(int row) noexcept
{
    m_error_line  = row;
    m_initialized = true;
}


int
SessionCfgState::getErrorLine() const noexcept
{
    return m_error_line;
}


void
SessionCfgState::setTypeAhead(bool enable) noexcept
{
    m_type_ahead  = enable;
    m_initialized = true;
}


bool
SessionCfgState::getTypeAhead() const noexcept
{
    return m_type_ahead;
}


// returns true if the current configuration is reasonable, and false if not.
bool
SessionCfgState::configOk(bool warn) const
{
    if (!m_initialized) {
        return false;
    }

    const int max_row = (getScreenSize() == SCREEN_27x132) ? ALTERNATE_ROWS
                                                           : PRIMARY_ROWS;
    if (m_error_line < 0 || m_error_line > max_row) {
        if (warn) {
            dbglog("SessionCfgState: error line %d is outside 0..%d\n",
                   m_error_line, max_row);
        }
        return false;
    }

    return true;
}


// the device geometry can't change under a live display;
// the other settings apply on the fly.
bool
SessionCfgState::needsReset(const SessionCfgState &other) const noexcept
{
    return (getScreenSize() != other.getScreenSize());
}

// vim: ts=8:et:sw=4:smarttab
