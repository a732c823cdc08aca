// The AidResponseBuilder turns an attention key into the bytes that go back
// to the host:
//
//     aid [row col] { [0xC0] length data... }
//
// The cursor row and column are 1-based.  Each field is sent as a one-byte
// length followed by its data; the 0xC0 location tag only appears in the
// structured response format.

#ifndef _INCLUDE_AID_RESPONSE_H_
#define _INCLUDE_AID_RESPONSE_H_

#include "w5250.h"

class CursorModel;
class FieldTable;
class Oia;
class ScreenBuffer;

// which fields go into the response
enum field_mode_t {
    FIELDS_NONE,        // no field data
    FIELDS_MODIFIED,    // fields with the MDT set and some content
    FIELDS_ALL          // every field with readable content
};

enum response_format_t {
    RESPONSE_LONG,          // length data
    RESPONSE_STRUCTURED     // 0xC0 length data
};

class AidResponseBuilder
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(AidResponseBuilder);

    AidResponseBuilder(ScreenBuffer &screen, const FieldTable &fields, Oia &oia);
    ~AidResponseBuilder() = default;

    // attention identifiers
    static const uint8 AID_ENTER            = 0xF1;
    static const uint8 AID_F1               = 0x31;   // F1..F12 are 0x31..0x3C
    static const uint8 AID_F13              = 0xB1;   // F13..F24 are 0xB1..0xBC
    static const uint8 AID_CLEAR            = 0xBD;
    static const uint8 AID_HELP             = 0xF3;
    static const uint8 AID_ROLL_DOWN        = 0xF4;   // page up
    static const uint8 AID_ROLL_UP          = 0xF5;   // page down
    static const uint8 AID_PRINT            = 0xF6;
    static const uint8 AID_RECORD_BACKSPACE = 0xF8;

    static const uint8 LOCATION_TAG         = 0xC0;

    // the AID of function key 1..24, or 0 for any other number
    static uint8 functionKeyAid(int key) noexcept;

    void setResponseFormat(response_format_t format) noexcept { m_format = format; }
    response_format_t getResponseFormat() const noexcept { return m_format; }

    // compose the response for an attention key.  row and col are the
    // 1-based cursor position; each is clamped into [0, rows] or [0, cols].
    // building a response clears an error inhibit and puts back the
    // error line.
    std::vector<uint8> buildResponse(uint8 aid, int row, int col,
                                     field_mode_t mode, bool include_cursor);

    std::vector<uint8> buildResponse(uint8 aid, const CursorModel &cursor,
                                     field_mode_t mode, bool include_cursor);

private:
    ScreenBuffer      &m_screen;
    const FieldTable  &m_fields;
    Oia               &m_oia;
    response_format_t  m_format;
};

#endif // _INCLUDE_AID_RESPONSE_H_

// vim: ts=8:et:sw=4:smarttab
