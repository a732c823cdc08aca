#include "Oia.h"
#include "doctest.h"

// records every notification it gets
struct ChangeLog
{
    explicit ChangeLog(Oia &oia) :
        m_oia(oia),
        m_handle(oia.addListener([this](const Oia &, oia_change_t change) {
            changes.push_back(change);
        }))
    {
    }

    ~ChangeLog() { m_oia.removeListener(m_handle); }

    Oia &m_oia;
    int  m_handle;
    std::vector<oia_change_t> changes;
};

TEST_CASE("Oia: initial state")
{
    Oia oia;
    CHECK_FALSE(oia.isKeyBoardLocked());
    CHECK_FALSE(oia.isKeysBuffered());
    CHECK_FALSE(oia.isInsertMode());
    CHECK_FALSE(oia.isMessageWait());
    CHECK_FALSE(oia.isScriptActive());
    CHECK_FALSE(oia.hasInhibitedText());
    CHECK_FALSE(oia.isErrorInhibit());
    CHECK_EQ(oia.getInputInhibited(), INPUTINHIBITED_NOTINHIBITED);
    CHECK_EQ(oia.getLevel(), OIA_CHANGED_NONE);
    CHECK_EQ(oia.getProgCheckCode(), 0);
    CHECK_EQ(oia.getOwner(), 0);
}

TEST_CASE("Oia: locking twice notifies once")
{
    Oia oia;
    ChangeLog log(oia);

    oia.setKeyboardLocked(true);
    oia.setKeyboardLocked(true);
    CHECK(oia.isKeyBoardLocked());
    REQUIRE_EQ(log.changes.size(), 1u);
    CHECK_EQ(log.changes[0], OIA_CHANGED_KEYBOARD_LOCKED);

    oia.setKeyboardLocked(false);
    oia.setKeyboardLocked(false);
    CHECK_FALSE(oia.isKeyBoardLocked());
    CHECK_EQ(log.changes.size(), 2u);
}

TEST_CASE("Oia: change categories")
{
    Oia oia;
    ChangeLog log(oia);

    oia.setInsertMode(true);
    oia.setInsertMode(true);
    oia.setMessageLightOn();
    oia.setMessageLightOn();
    oia.setMessageLightOff();
    oia.setKeysBuffered(true);
    oia.setScriptActive(true);
    oia.setInputInhibited(INPUTINHIBITED_SYSTEM_WAIT, 0);
    oia.setInputInhibited(INPUTINHIBITED_SYSTEM_WAIT, 0);

    const std::vector<oia_change_t> ref = {
        OIA_CHANGED_INSERT_MODE,
        OIA_CHANGED_MESSAGELIGHT,
        OIA_CHANGED_MESSAGELIGHT,
        OIA_CHANGED_KEYS_BUFFERED,
        OIA_CHANGED_SCRIPT,
        OIA_CHANGED_INPUTINHIBITED
    };
    CHECK(log.changes == ref);
    CHECK_EQ(oia.getLevel(), OIA_CHANGED_INPUTINHIBITED);
}

TEST_CASE("Oia: events always notify")
{
    Oia oia;
    ChangeLog log(oia);

    oia.setAudibleBell();
    oia.setAudibleBell();
    oia.clearScreen();
    oia.clearScreen();
    oia.screenSizeChanged();

    const std::vector<oia_change_t> ref = {
        OIA_CHANGED_BELL,
        OIA_CHANGED_BELL,
        OIA_CHANGED_CLEAR_SCREEN,
        OIA_CHANGED_CLEAR_SCREEN,
        OIA_CHANGED_SCREEN_SIZE
    };
    CHECK(log.changes == ref);
}

TEST_CASE("Oia: input inhibit")
{
    Oia oia;
    ChangeLog log(oia);

    SUBCASE("comm check")
    {
        oia.setInputInhibited(INPUTINHIBITED_COMMCHECK, 505);
        CHECK_EQ(oia.getInputInhibited(), INPUTINHIBITED_COMMCHECK);
        CHECK_EQ(oia.getCommCheckCode(), 505);
        CHECK_EQ(oia.getInhibitCode(), 505);
        CHECK(oia.isErrorInhibit());
        CHECK_FALSE(oia.hasInhibitedText());
        CHECK(oia.getInhibitedText().empty());
    }

    SUBCASE("machine check")
    {
        oia.setInputInhibited(INPUTINHIBITED_MACHINECHECK, 42);
        CHECK_EQ(oia.getMachineCheckCode(), 42);
        CHECK_EQ(oia.getCommCheckCode(), 0);
        CHECK(oia.isErrorInhibit());
    }

    SUBCASE("system wait is not an error")
    {
        oia.setInputInhibited(INPUTINHIBITED_SYSTEM_WAIT, 0);
        CHECK_FALSE(oia.isErrorInhibit());
    }

    SUBCASE("messages are kept verbatim")
    {
        const std::string long_msg(10000, 'm');
        oia.setInputInhibited(INPUTINHIBITED_OTHER, 5, long_msg);
        CHECK(oia.hasInhibitedText());
        CHECK_EQ(oia.getInhibitedText(), long_msg);

        const std::string ctrl("line1\nline2\t\x07\x1b[0m");
        oia.setInputInhibited(INPUTINHIBITED_OTHER, 5, ctrl);
        CHECK_EQ(oia.getInhibitedText(), ctrl);

        const std::string empty;
        oia.setInputInhibited(INPUTINHIBITED_OTHER, 5, empty);
        CHECK(oia.hasInhibitedText());
        CHECK(oia.getInhibitedText().empty());

        CHECK_EQ(log.changes.size(), 3u);
    }

    SUBCASE("same message twice notifies once")
    {
        oia.setInputInhibited(INPUTINHIBITED_OTHER, 5, "protected");
        oia.setInputInhibited(INPUTINHIBITED_OTHER, 5, "protected");
        CHECK_EQ(log.changes.size(), 1u);

        // dropping the message is a change
        oia.setInputInhibited(INPUTINHIBITED_OTHER, 5);
        CHECK_EQ(log.changes.size(), 2u);
        CHECK_FALSE(oia.hasInhibitedText());
    }
}

TEST_CASE("Oia: listeners")
{
    Oia oia;
    std::vector<int> order;

    const int h1 = oia.addListener([&order](const Oia &, oia_change_t) { order.push_back(1); });
    const int h2 = oia.addListener([&order](const Oia &, oia_change_t) { order.push_back(2); });
    const int h3 = oia.addListener([&order](const Oia &, oia_change_t) { order.push_back(3); });
    CHECK(h1 != h2);
    CHECK(h2 != h3);

    oia.setAudibleBell();
    CHECK(order == std::vector<int>({ 1, 2, 3 }));

    SUBCASE("removal applies to later events only")
    {
        order.clear();
        CHECK(oia.removeListener(h2));
        oia.setAudibleBell();
        CHECK(order == std::vector<int>({ 1, 3 }));

        CHECK_FALSE(oia.removeListener(h2));
        CHECK_FALSE(oia.removeListener(9999));
    }

    SUBCASE("a listener can remove itself")
    {
        order.clear();
        int h4 = 0;
        h4 = oia.addListener([&](const Oia &, oia_change_t) {
            order.push_back(4);
            oia.removeListener(h4);
        });
        oia.setAudibleBell();
        oia.setAudibleBell();
        CHECK(order == std::vector<int>({ 1, 2, 3, 4, 1, 2, 3 }));
    }

    SUBCASE("listeners see the new state")
    {
        bool seen = false;
        oia.addListener([&seen](const Oia &o, oia_change_t change) {
            if (change == OIA_CHANGED_KEYBOARD_LOCKED) {
                seen = o.isKeyBoardLocked();
            }
        });
        oia.setKeyboardLocked(true);
        CHECK(seen);
    }
}

TEST_CASE("Oia: owner")
{
    Oia oia;
    ChangeLog log(oia);
    oia.setOwner(3);
    CHECK_EQ(oia.getOwner(), 3);
    CHECK(log.changes.empty());
}

// vim: ts=8:et:sw=4:smarttab
