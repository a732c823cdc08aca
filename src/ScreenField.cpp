#include "ScreenField.h"

#include <algorithm>

ScreenField::ScreenField(int index, int start_pos, int attr, int length,
                         int ffw1, int ffw2, int fcw1, int fcw2) :
    m_index(index),
    m_start_pos(start_pos),
    m_length(0),
    m_attr(0),
    m_ffw1(0),
    m_ffw2(0),
    m_fcw1(0),
    m_fcw2(0),
    m_shift(SHIFT_ALPHA),
    m_continued(false),
    m_progression(0)
{
    redefine(attr, length, ffw1, ffw2, fcw1, fcw2);
}


void
ScreenField::redefine(int attr, int length, int ffw1, int ffw2, int fcw1, int fcw2)
{
    m_attr   = attr;
    m_length = std::max(length, 0);
    m_ffw1   = ffw1;
    m_ffw2   = ffw2;
    m_fcw1   = fcw1;
    m_fcw2   = fcw2;
    decode();
}


void
ScreenField::decode() noexcept
{
    static const shift_type_t shift_map[8] = {
        SHIFT_ALPHA,            // 0: alpha shift
        SHIFT_OUTPUT,           // 1: alpha only, treated as output
        SHIFT_BOTH,             // 2: numeric shift
        SHIFT_NUMERIC,          // 3: numeric only
        SHIFT_ALPHA,            // 4: katakana shift
        SHIFT_HIDDEN,           // 5: digits only, no display
        SHIFT_OUTPUT,           // 6: I/O (magnetic stripe)
        SHIFT_SIGNED_NUMERIC    // 7: signed numeric
    };
    m_shift = shift_map[m_ffw1 & 0x07];

    m_continued   = ((m_fcw1 & 0x86) == 0x86);
    m_progression = ((m_fcw1 & 0x88) == 0x88) ? m_fcw2 : 0;
}

// vim: ts=8:et:sw=4:smarttab
