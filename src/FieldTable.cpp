// This file implements the FieldTable class.

#include "FieldTable.h"
#include "ScreenBuffer.h"

#include <cctype>

// ----------------------------------------------------------------------------
// FieldTable
// ----------------------------------------------------------------------------

FieldTable::FieldTable(ScreenBuffer &screen) :
    m_screen(screen),
    m_current(nullptr)
{
}


void
FieldTable::clear()
{
    m_current = nullptr;
    m_fields.clear();
}


ScreenField*
FieldTable::addField(int start_pos, int attr, int length,
                     int ffw1, int ffw2, int fcw1, int fcw2)
{
    for (auto &field : m_fields) {
        if (field->startPos() == start_pos) {
            field->redefine(attr, length, ffw1, ffw2, fcw1, fcw2);
            return field.get();
        }
    }

    const int index = getFieldCount();
    m_fields.push_back(std::make_unique<ScreenField>(
                           index, start_pos, attr, length,
                           ffw1, ffw2, fcw1, fcw2));
    return m_fields.back().get();
}


ScreenField*
FieldTable::findByPosition(int pos) const
{
    for (auto &field : m_fields) {
        if (field->withinField(pos)) {
            return field.get();
        }
    }
    return nullptr;
}


ScreenField*
FieldTable::getField(int index) const
{
    if (index < 0 || index >= getFieldCount()) {
        return nullptr;
    }
    return m_fields[index].get();
}


ScreenField*
FieldTable::getFirstInputField() const
{
    for (auto &field : m_fields) {
        if (!field->isBypassField()) {
            return field.get();
        }
    }
    return nullptr;
}


// ----------------------------------------------------------------------------
// current field
// ----------------------------------------------------------------------------

void
FieldTable::setCurrentField(ScreenField *field) noexcept
{
    m_current = field;
}


bool
FieldTable::isCurrentFieldBypassField() const noexcept
{
    return m_current && m_current->isBypassField();
}


bool
FieldTable::isCurrentFieldFER() const noexcept
{
    return m_current && m_current->isFER();
}


bool
FieldTable::isCurrentFieldDupEnabled() const noexcept
{
    return m_current && m_current->isDupEnabled();
}


bool
FieldTable::isCurrentFieldToUpper() const noexcept
{
    return m_current && m_current->isToUpper();
}


bool
FieldTable::isCurrentFieldAutoEnter() const noexcept
{
    return m_current && m_current->isAutoEnter();
}


bool
FieldTable::isCurrentFieldMandatoryEnter() const noexcept
{
    return m_current && m_current->isMandatoryEnter();
}


bool
FieldTable::isCurrentFieldContinued() const noexcept
{
    return m_current && m_current->isContinued();
}


bool
FieldTable::isCurrentFieldModified() const noexcept
{
    return m_current && m_current->isModified();
}


ScreenField*
FieldTable::gotoFieldNext()
{
    const int count = getFieldCount();
    if (getFirstInputField() == nullptr) {
        return nullptr;
    }

    // the host can name the successor of a field explicitly
    if (m_current) {
        ScreenField *target = getField(m_current->getCursorProgression() - 1);
        if (target && !target->isBypassField()) {
            m_current = target;
            return m_current;
        }
    }

    int idx = (m_current) ? m_current->getIndex() : -1;
    for (int n = 0; n < count; n++) {
        idx = (idx + 1) % count;
        if (!m_fields[idx]->isBypassField()) {
            break;
        }
    }

    m_current = m_fields[idx].get();
    return m_current;
}


ScreenField*
FieldTable::gotoFieldPrev()
{
    const int count = getFieldCount();
    if (getFirstInputField() == nullptr) {
        return nullptr;
    }

    int idx = (m_current) ? m_current->getIndex() : 0;
    for (int n = 0; n < count; n++) {
        idx = (idx + count - 1) % count;
        if (!m_fields[idx]->isBypassField()) {
            break;
        }
    }

    m_current = m_fields[idx].get();
    return m_current;
}


// ----------------------------------------------------------------------------
// field contents
// ----------------------------------------------------------------------------

bool
FieldTable::fitsScreen(const ScreenField &field) const noexcept
{
    return (field.getLength() > 0)
        && m_screen.isValidPos(field.startPos())
        && m_screen.isValidPos(field.endPos());
}


bool
FieldTable::setFieldText(ScreenField *field, const std::string &text)
{
    if (!field || !fitsScreen(*field)) {
        return false;
    }

    const int len = field->getLength();
    const int start = field->startPos();
    for (int n = 0; n < len; n++) {
        uint8 ch = 0x00;
        if (n < static_cast<int>(text.size())) {
            ch = static_cast<uint8>(text[n]);
            if (field->isToUpper() && ch < 0x80) {
                ch = static_cast<uint8>(toupper(ch));
            }
        }
        m_screen.setChar(start + n, ch);
    }

    field->setMDT();
    return true;
}


bool
FieldTable::getFieldText(const ScreenField *field, std::string *text) const
{
    assert(text != nullptr);
    if (!field || !fitsScreen(*field)) {
        return false;
    }

    const std::vector<uint8> data =
        m_screen.getPlaneData(field->startPos(), field->getLength(), PLANE_TEXT);

    size_t used = data.size();
    while (used > 0 && data[used-1] == 0x00) {
        used--;
    }
    text->assign(data.begin(), data.begin() + used);
    return true;
}


bool
FieldTable::isMasterMDT() const noexcept
{
    for (auto &field : m_fields) {
        if (field->isModified()) {
            return true;
        }
    }
    return false;
}


void
FieldTable::resetAllMDT() noexcept
{
    for (auto &field : m_fields) {
        field->resetMDT();
    }
}

// vim: ts=8:et:sw=4:smarttab
