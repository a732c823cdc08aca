// This file implements the AidResponseBuilder class.

#include "AidResponse.h"
#include "CursorModel.h"
#include "FieldTable.h"
#include "Oia.h"
#include "ScreenBuffer.h"

#include <algorithm>

const uint8 AidResponseBuilder::AID_ENTER;
const uint8 AidResponseBuilder::AID_F1;
const uint8 AidResponseBuilder::AID_F13;
const uint8 AidResponseBuilder::AID_CLEAR;
const uint8 AidResponseBuilder::AID_HELP;
const uint8 AidResponseBuilder::AID_ROLL_DOWN;
const uint8 AidResponseBuilder::AID_ROLL_UP;
const uint8 AidResponseBuilder::AID_PRINT;
const uint8 AidResponseBuilder::AID_RECORD_BACKSPACE;
const uint8 AidResponseBuilder::LOCATION_TAG;

// the length of a field in the response is a single byte
static const int MAX_FIELD_DATA = 255;

// ----------------------------------------------------------------------------
// AidResponseBuilder
// ----------------------------------------------------------------------------

AidResponseBuilder::AidResponseBuilder(ScreenBuffer &screen,
                                       const FieldTable &fields,
                                       Oia &oia) :
    m_screen(screen),
    m_fields(fields),
    m_oia(oia),
    m_format(RESPONSE_LONG)
{
}


uint8
AidResponseBuilder::functionKeyAid(int key) noexcept
{
    if (key >= 1 && key <= 12) {
        return static_cast<uint8>(AID_F1 + key - 1);
    }
    if (key >= 13 && key <= 24) {
        return static_cast<uint8>(AID_F13 + key - 13);
    }
    return 0x00;
}


std::vector<uint8>
AidResponseBuilder::buildResponse(uint8 aid, const CursorModel &cursor,
                                  field_mode_t mode, bool include_cursor)
{
    return buildResponse(aid, cursor.getCurrentRow(), cursor.getCurrentCol(),
                         mode, include_cursor);
}


std::vector<uint8>
AidResponseBuilder::buildResponse(uint8 aid, int row, int col,
                                  field_mode_t mode, bool include_cursor)
{
    std::vector<uint8> resp;
    resp.push_back(aid);

    if (include_cursor) {
        row = std::min(std::max(row, 0), m_screen.getRows());
        col = std::min(std::max(col, 0), m_screen.getCols());
        resp.push_back(static_cast<uint8>(row));
        resp.push_back(static_cast<uint8>(col));
    }

    // an attention key is the way out of an error.  the error line comes
    // back before any field is read so a field on that row sends its data.
    if (m_oia.isErrorInhibit()) {
        m_screen.restoreErrorLine();
        m_oia.setInputInhibited(INPUTINHIBITED_NOTINHIBITED, 0);
    }

    if (mode != FIELDS_NONE) {
        const int count = m_fields.getFieldCount();
        for (int n = 0; n < count; n++) {
            const ScreenField *field = m_fields.getField(n);
            if (mode == FIELDS_MODIFIED && !field->isModified()) {
                continue;
            }

            std::string text;
            if (!m_fields.getFieldText(field, &text)) {
                continue;  // nothing readable
            }
            if (mode == FIELDS_MODIFIED && text.empty()) {
                continue;
            }

            if (static_cast<int>(text.size()) > MAX_FIELD_DATA) {
                dbglog("AidResponseBuilder: field %d data cut from %d to %d bytes\n",
                       n+1, static_cast<int>(text.size()), MAX_FIELD_DATA);
                text.resize(MAX_FIELD_DATA);
            }

            if (m_format == RESPONSE_STRUCTURED) {
                resp.push_back(LOCATION_TAG);
            }
            resp.push_back(static_cast<uint8>(text.size()));
            resp.insert(resp.end(), text.begin(), text.end());
        }
    }

    return resp;
}

// vim: ts=8:et:sw=4:smarttab
