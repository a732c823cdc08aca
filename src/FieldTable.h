// The FieldTable holds the format of the current display: an ordered list
// of fields, in the order the host defined them with Start Field orders.
// It also tracks which field the operator is in, and moves field text in
// and out of the character plane of the ScreenBuffer.

#ifndef _INCLUDE_FIELD_TABLE_H_
#define _INCLUDE_FIELD_TABLE_H_

#include "ScreenField.h"
#include "w5250.h"

class ScreenBuffer;

class FieldTable
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(FieldTable);

    explicit FieldTable(ScreenBuffer &screen);
    ~FieldTable() = default;

    // discard the format
    void clear();

    // define a field starting at start_pos.  if a field already starts
    // there, it is redefined in place and keeps its table slot.
    ScreenField* addField(int start_pos, int attr, int length,
                          int ffw1, int ffw2, int fcw1, int fcw2);

    // the first field, in table order, containing pos, or nullptr
    ScreenField* findByPosition(int pos) const;

    // 0-based lookup; nullptr if out of range
    ScreenField* getField(int index) const;
    int          getFieldCount() const noexcept
        { return static_cast<int>(m_fields.size()); }

    // the first non-bypass field, or nullptr
    ScreenField* getFirstInputField() const;

    // ---- the field the operator is in ----
    void         setCurrentField(ScreenField *field) noexcept;
    ScreenField* getCurrentField() const noexcept { return m_current; }
    bool         isCurrentField() const noexcept { return m_current != nullptr; }

    // predicates on the current field; all false without one
    bool isCurrentFieldBypassField()    const noexcept;
    bool isCurrentFieldFER()            const noexcept;
    bool isCurrentFieldDupEnabled()     const noexcept;
    bool isCurrentFieldToUpper()        const noexcept;
    bool isCurrentFieldAutoEnter()      const noexcept;
    bool isCurrentFieldMandatoryEnter() const noexcept;
    bool isCurrentFieldContinued()      const noexcept;
    bool isCurrentFieldModified()       const noexcept;

    // make the next (previous) input field current and return it.
    // the search wraps around the table and skips bypass fields.
    // returns nullptr, leaving the current field alone, if there is no
    // input field at all.
    ScreenField* gotoFieldNext();
    ScreenField* gotoFieldPrev();

    // ---- field contents ----

    // write text into the field, cut at the field length and padded with
    // nulls.  sets the field's MDT.  false if the field can't hold data.
    bool setFieldText(ScreenField *field, const std::string &text);

    // read the field contents without trailing nulls.  false if the field
    // has no content to read (zero length or not within the buffer).
    bool getFieldText(const ScreenField *field, std::string *text) const;

    // true if any field has its MDT set
    bool isMasterMDT() const noexcept;

    void resetAllMDT() noexcept;

private:
    // true if the field lies wholly inside the buffer
    bool fitsScreen(const ScreenField &field) const noexcept;

    ScreenBuffer                              &m_screen;
    std::vector<std::unique_ptr<ScreenField>>  m_fields;    // in definition order
    ScreenField                               *m_current;   // nullptr if none
};

#endif // _INCLUDE_FIELD_TABLE_H_

// vim: ts=8:et:sw=4:smarttab
