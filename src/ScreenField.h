// A ScreenField describes one field of the display format: where it starts,
// how long it is, and the format words the host sent with the Start Field
// order that created it.  The shift type and the flags are decoded from the
// format words once, when the field is (re)defined.
//
// Field format word 1 (ffw1):
//    0x20 - bypass (protected)
//    0x10 - duplicate enable
//    0x08 - modified data tag
//    0x07 - shift/edit specification
// Field format word 2 (ffw2):
//    0x80 - auto enter
//    0x40 - field exit required
//    0x20 - monocase (translate to upper case)
//    0x08 - mandatory enter
//    0x07 - right adjust/fill specification
// Field control word (fcw1, fcw2):
//    fcw1 & 0x88 == 0x88 - fcw2 is the cursor progression field number
//    fcw1 & 0x86 == 0x86 - continued entry field; fcw2 1=first, 2=last, 3=middle

#ifndef _INCLUDE_SCREEN_FIELD_H_
#define _INCLUDE_SCREEN_FIELD_H_

#include "w5250.h"

enum shift_type_t {
    SHIFT_ALPHA,            // any character
    SHIFT_OUTPUT,           // output only
    SHIFT_BOTH,             // alpha or numeric shift
    SHIFT_NUMERIC,          // digits plus + - , . and blank
    SHIFT_HIDDEN,           // input is not displayed
    SHIFT_SIGNED_NUMERIC    // digits only; the sign comes from the exit key
};

class ScreenField
{
public:
    ScreenField(int index, int start_pos, int attr, int length,
                int ffw1, int ffw2, int fcw1, int fcw2);

    // replace everything but the start position and table slot
    void redefine(int attr, int length, int ffw1, int ffw2, int fcw1, int fcw2);

    // 0-based slot in the owning FieldTable
    int  getIndex()  const noexcept { return m_index; }

    int  startPos()  const noexcept { return m_start_pos; }
    int  endPos()    const noexcept { return m_start_pos + m_length - 1; }
    int  getLength() const noexcept { return m_length; }
    int  getAttr()   const noexcept { return m_attr; }

    // true if pos lies within [startPos(), endPos()].
    // a zero length field contains no positions, not even its own start.
    bool withinField(int pos) const noexcept
        { return (m_length > 0) && (pos >= m_start_pos) && (pos <= endPos()); }

    int  getFFW1() const noexcept { return m_ffw1; }
    int  getFFW2() const noexcept { return m_ffw2; }
    int  getFCW1() const noexcept { return m_fcw1; }
    int  getFCW2() const noexcept { return m_fcw2; }

    shift_type_t getShiftType() const noexcept { return m_shift; }

    bool isBypassField()    const noexcept { return (m_ffw1 & 0x20) != 0; }
    bool isDupEnabled()     const noexcept { return (m_ffw1 & 0x10) != 0; }
    bool isAutoEnter()      const noexcept { return (m_ffw2 & 0x80) != 0; }
    bool isFER()            const noexcept { return (m_ffw2 & 0x40) != 0; }
    bool isToUpper()        const noexcept { return (m_ffw2 & 0x20) != 0; }
    bool isMandatoryEnter() const noexcept { return (m_ffw2 & 0x08) != 0; }
    int  getAdjustment()    const noexcept { return (m_ffw2 & 0x07); }

    bool isNumeric()       const noexcept { return m_shift == SHIFT_NUMERIC; }
    bool isSignedNumeric() const noexcept { return m_shift == SHIFT_SIGNED_NUMERIC; }
    bool isHidden()        const noexcept { return m_shift == SHIFT_HIDDEN; }

    bool isContinued()       const noexcept { return m_continued; }
    bool isContinuedFirst()  const noexcept { return m_continued && (m_fcw2 == 1); }
    bool isContinuedLast()   const noexcept { return m_continued && (m_fcw2 == 2); }
    bool isContinuedMiddle() const noexcept { return m_continued && (m_fcw2 == 3); }

    // 1-based index of the field the cursor goes to on field advance,
    // or 0 if the normal order applies
    int  getCursorProgression() const noexcept { return m_progression; }

    // modified data tag
    bool isModified() const noexcept { return (m_ffw1 & 0x08) != 0; }
    void setMDT()   noexcept { m_ffw1 |=  0x08; }
    void resetMDT() noexcept { m_ffw1 &= ~0x08; }

private:
    // derive m_shift, m_continued and m_progression from the format words
    void decode() noexcept;

    int          m_index;       // slot in the field table
    int          m_start_pos;   // linear position of the first cell
    int          m_length;      // number of cells, never negative
    int          m_attr;        // display attribute of the field
    int          m_ffw1;
    int          m_ffw2;
    int          m_fcw1;
    int          m_fcw2;

    shift_type_t m_shift;
    bool         m_continued;
    int          m_progression;
};

#endif // _INCLUDE_SCREEN_FIELD_H_

// vim: ts=8:et:sw=4:smarttab
