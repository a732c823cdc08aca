// This file implements the host:: services for the 5250 model:
// the .ini configuration store and the debug log.  The configuration sits
// on wxFileConfig; only wxBase is required.

#include "host.h"

#include "wx/fileconf.h"        // for wxFileConfig
#include "wx/filename.h"        // for wxFileName
#include "wx/stdpaths.h"        // for wxStandardPaths

#include <cstdarg>              // for var args
#include <cstdio>
#include <fstream>

// ============================================================================
// module state
// ============================================================================

// revision of the ini file layout
static const char *config_version = "1";

// all settings live beneath this path in the ini file
static const std::string config_root("/emu5250/session-0/");

static std::string                   app_home;  // dir holding the ini file
static std::unique_ptr<wxFileConfig> config;    // open configuration file

static std::ofstream                 dbg_ofs;   // debug log, if open

// ============================================================================
// file-local functions
// ============================================================================

// point the config object at a subgroup.  keys are then relative to it.
static void
selectGroup(const std::string &subgroup)
{
    assert(config);
    config->SetPath(config_root + subgroup);
}


// the file named by the caller, or emu5250.ini next to the executable
static wxFileName
iniFileName(const std::string &ini_name)
{
    if (!ini_name.empty()) {
        wxFileName ini_file(ini_name);
        ini_file.MakeAbsolute();
        return ini_file;
    }

    const wxStandardPathsBase &stdp = wxStandardPaths::Get();
    const wxFileName exe_path(stdp.GetExecutablePath());
    return wxFileName(exe_path.GetPath(wxPATH_GET_VOLUME), "emu5250.ini");
}


// a file written by some other revision is read anyway, on a best effort basis
static void
checkConfigVersion()
{
    std::string version;
    if (host::configReadStr("..", "configversion", &version) &&
        (version != config_version)) {
        dbglog("host: config file version '%s' found, '%s' expected\n",
               version.c_str(), config_version);
    }
}


// ------------------------------------------------------------------------
//  debug log, not in the host namespace
// ------------------------------------------------------------------------

#ifdef _DEBUG
static void
dbglogOpen(const std::string &logname)
{
    assert(!dbg_ofs.is_open());     // only one log at a time
    dbg_ofs.open(logname.c_str(), std::ofstream::out | std::ofstream::trunc);
    if (!dbg_ofs.good()) {
        fprintf(stderr, "host: can't open '%s' for logging\n", logname.c_str());
    }
}
#endif


void
dbglog(const char *fmt, ...)
{
    if (!dbg_ofs.is_open() || !dbg_ofs.good()) {
        return;
    }

    char buff[1000];
    va_list args;
    va_start(args, fmt);
    vsnprintf(&buff[0], sizeof(buff), fmt, args);
    va_end(args);

    // flush each message so an assert doesn't eat the tail of the log
    dbg_ofs << &buff[0];
    dbg_ofs.flush();
}


// ============================================================================
// "public" functions
// ============================================================================

void
host::initialize(const std::string &ini_name)
{
    assert(!config);

#ifdef _DEBUG
    dbglogOpen("emu5250dbg.log");
#endif

    const wxFileName ini_file = iniFileName(ini_name);
    app_home = ini_file.GetPath(wxPATH_GET_VOLUME).ToStdString();

    config = std::make_unique<wxFileConfig>(
                wxEmptyString,                  // appName
                wxEmptyString,                  // vendorName
                ini_file.GetFullPath(),         // localFilename
                wxEmptyString,                  // globalFilename
                wxCONFIG_USE_LOCAL_FILE
             );

    checkConfigVersion();
}


// flush the configuration and close the log.  the caller owns the
// lifetime of the host module, so this must be called before exit.
void
host::terminate()
{
    if (config) {
        configWriteStr("..", "configversion", config_version);
        if (!config->Flush()) {
            dbglog("host: writing the config file failed\n");
        }
        config = nullptr;
    }

    if (dbg_ofs.is_open()) {
        dbg_ofs.close();
    }
}


bool
host::isInitialized() noexcept
{
    return (config != nullptr);
}


std::string
host::getAppHome()
{
    return app_home;
}


// ----------------------------------------------------------------------------
// configuration access
// ----------------------------------------------------------------------------

bool
host::configReadStr(const std::string &subgroup,
                    const std::string &key,
                    std::string *val,
                    const std::string *defaultval)
{
    assert(val != nullptr);
    selectGroup(subgroup);

    wxString wxval;
    if (config->Read(key, &wxval)) {
        *val = wxval.ToStdString();
        return true;
    }

    *val = (defaultval != nullptr) ? *defaultval : std::string();
    return false;
}


// integers may be written in decimal, hex (0x) or octal (leading 0)
bool
host::configReadInt(const std::string &subgroup,
                    const std::string &key,
                    int *val,
                    const int defaultval)
{
    assert(val != nullptr);
    *val = defaultval;

    std::string str;
    if (!configReadStr(subgroup, key, &str)) {
        return false;
    }

    long v = 0;
    if (!wxString(str).ToLong(&v, 0)) {
        dbglog("host: %s/%s='%s' is not a number\n",
               subgroup.c_str(), key.c_str(), str.c_str());
        return false;
    }

    *val = static_cast<int>(v);
    return true;
}


// booleans are stored as 0 or 1; anything else yields the default
void
host::configReadBool(const std::string &subgroup,
                     const std::string &key,
                     bool *val,
                     const bool defaultval)
{
    assert(val != nullptr);
    int v = 0;
    if (configReadInt(subgroup, key, &v, 0) && (v == 0 || v == 1)) {
        *val = (v == 1);
    } else {
        *val = defaultval;
    }
}


void
host::configWriteStr(const std::string &subgroup,
                     const std::string &key,
                     const std::string &val)
{
    selectGroup(subgroup);
    if (!config->Write(wxString(key), wxString(val))) {
        dbglog("host: failed to write config key '%s/%s'\n",
               subgroup.c_str(), key.c_str());
    }
}


void
host::configWriteInt(const std::string &subgroup,
                     const std::string &key,
                     const int val)
{
    configWriteStr(subgroup, key, std::to_string(val));
}


void
host::configWriteBool(const std::string &subgroup,
                      const std::string &key,
                      const bool val)
{
    configWriteInt(subgroup, key, (val) ? 1 : 0);
}

// vim: ts=8:et:sw=4:smarttab
