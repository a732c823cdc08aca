#ifndef _INCLUDE_COMPILE_OPTIONS_H_
#define _INCLUDE_COMPILE_OPTIONS_H_

// define these switches below to turn various features on and off.
// they are fairly safe to enable or disable.

// ========================================================================
//  Session5250.cpp options
// ========================================================================

// define to 1 to have every inbound order echoed to dbglog().
// it is very chatty, so it is off unless chasing a stream problem.
#define TRACE_ORDERS 0

// define to 1 to have rejected operator input (locked keyboard, protected
// area, bad numeric data) reported to dbglog().
#define TRACE_INPUT_ERRORS 1

// ========================================================================
// screen geometry
// ========================================================================

// the 5250 supports two display geometries.  the primary one is used on
// power up and after Clear Unit; the alternate one after Clear Unit Alternate.
#define PRIMARY_ROWS    24
#define PRIMARY_COLS    80
#define ALTERNATE_ROWS  27
#define ALTERNATE_COLS 132

#endif // _INCLUDE_COMPILE_OPTIONS_H_

// vim: ts=8:et:sw=4:smarttab
