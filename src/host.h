// This module encapsulates non-model, host-dependent services:
//    configuration persistence
//    debug logging
//
// The configuration is kept in an .ini file, with data stored hierarchically.
// There are a few global ini values that describe the ini file format
// revision.  Then there are N sets of session configuration state; presently
// things are hardwired to have just a single set of state.  Within a given
// set of state, each subgroup holds the settings for one part of a session.
//
// All the config* functions take as a first parameter the "subgroup", which
// is a concatenation of the ini storage path up until a final set of state.
// The "key" is the final level of lookup.  There is nothing special about it;
// the interface could have required the caller to send the subgroup+key, but
// this way seemed to save a bit of code at the call point.

#ifndef _INCLUDE_HOST_H_
#define _INCLUDE_HOST_H_

#include "w5250.h"

namespace host
{
    // must be called at time 0 to initialize things.
    // if ini_name is empty, emu5250.ini next to the executable is used.
    void initialize(const std::string &ini_name = "");

    // this should be called at the end of the world to flush the
    // configuration and close the debug log.
    void terminate();

    // true between initialize() and terminate()
    bool isInitialized() noexcept;

    // ---- read or write an entry in the configuration file ----
    // there are keys maintained for separate categories.
    // the configRead* functions take a defaultval; this is the value returned
    // if the key for that subgroup isn't found in the config file.

    bool configReadStr(  const std::string &subgroup,
                         const std::string &key,
                         std::string *val,
                         const std::string *defaultval = nullptr);

    void configWriteStr( const std::string &subgroup,
                         const std::string &key,
                         const std::string &val);

    bool configReadInt(  const std::string &subgroup,
                         const std::string &key,
                         int *val,
                         const int defaultval = 0);

    void configWriteInt( const std::string &subgroup,
                         const std::string &key,
                         const int val);

    void configReadBool( const std::string &subgroup,
                         const std::string &key,
                         bool *val,
                         const bool defaultval = false);

    void configWriteBool(const std::string &subgroup,
                         const std::string &key,
                         const bool val);

    // ---- file path functions ----

    // return the absolute path to the dir containing the app
    std::string getAppHome();

} // namespace host

#endif // _INCLUDE_HOST_H_

// vim: ts=8:et:sw=4:smarttab
