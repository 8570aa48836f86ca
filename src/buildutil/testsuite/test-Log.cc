/*
 * Copyright (c) 2008-2014, Pedigree Developers
 *
 * Please see the CONTRIB file in the root of the source tree for a full
 * list of contributors.
 *
 * Permission to use, copy, modify, and distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 */

#define KEEL_EXTERNAL_SOURCE 1

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <Log.h>
#include <memory/MapType.h>
#include <utilities/StaticString.h>

class CapturingCallback : public Log::LogCallback
{
    public:
        virtual void callback(const char *str)
        {
            lines.push_back(str);
        }

        std::vector<std::string> lines;
};

class KeelLog : public ::testing::Test
{
    protected:
        virtual void SetUp()
        {
            Log::instance().installCallback(&m_Callback, true);
        }

        virtual void TearDown()
        {
            Log::instance().removeCallback(&m_Callback);
        }

        const std::string &last() const
        {
            return m_Callback.lines.back();
        }

        CapturingCallback m_Callback;
};

TEST_F(KeelLog, NoticeFormat)
{
    NOTICE("hello " << 42);
    ASSERT_EQ(m_Callback.lines.size(), 1);
    EXPECT_EQ(last(), "(NN) hello 42\n");
}

TEST_F(KeelLog, SeverityPrefixes)
{
    WARNING("w");
    ERROR("e");
    ASSERT_EQ(m_Callback.lines.size(), 2);
    EXPECT_EQ(m_Callback.lines[0], "(WW) w\n");
    EXPECT_EQ(m_Callback.lines[1], "(EE) e\n");
}

TEST_F(KeelLog, HexResetsEachEntry)
{
    NOTICE(Hex << 255);
    NOTICE(255);
    ASSERT_EQ(m_Callback.lines.size(), 2);
    EXPECT_EQ(m_Callback.lines[0], "(NN) 0xff\n");
    EXPECT_EQ(m_Callback.lines[1], "(NN) 255\n");
}

TEST_F(KeelLog, NegativeNumbers)
{
    NOTICE(-12 << " " << static_cast<long long>(-1));
    EXPECT_EQ(last(), "(NN) -12 -1\n");
}

TEST_F(KeelLog, Booleans)
{
    NOTICE(true << " " << false);
    EXPECT_EQ(last(), "(NN) true false\n");
}

TEST_F(KeelLog, StaticStrings)
{
    StaticString<16> s("abc");
    NOTICE("[" << s << "]");
    EXPECT_EQ(last(), "(NN) [abc]\n");
}

TEST_F(KeelLog, ProtectionNames)
{
    NOTICE(protectionName(None) << " " << protectionName(Read) << " "
           << protectionName(ReadWrite) << " " << protectionName(Execute));
    EXPECT_EQ(last(), "(NN) none read read_write execute\n");
}

TEST_F(KeelLog, CacheTypeNames)
{
    NOTICE(cacheTypeName(WriteBack) << " " << cacheTypeName(WriteCombining) << " "
           << cacheTypeName(Uncached));
    EXPECT_EQ(last(), "(NN) write_back write_combining uncached\n");
}

TEST_F(KeelLog, EntriesAreKept)
{
    NOTICE("kept");
    EXPECT_STREQ(Log::instance().getLatestEntry().str, "kept");
    EXPECT_EQ(Log::instance().getLatestEntry().type, Log::Notice);
}

TEST_F(KeelLog, RemovedCallbackIsSilent)
{
    Log::instance().removeCallback(&m_Callback);
    NOTICE("unheard");
    EXPECT_TRUE(m_Callback.lines.empty());
    Log::instance().installCallback(&m_Callback, true);
}

TEST_F(KeelLog, CallbackLevelFilters)
{
    Log::instance().setCallbackLevel(Log::Warning);
    NOTICE("quiet");
    WARNING("loud");
    Log::instance().setCallbackLevel(Log::Debug);

    ASSERT_EQ(m_Callback.lines.size(), 1);
    EXPECT_EQ(last(), "(WW) loud\n");
    EXPECT_STREQ(Log::instance().getLatestEntry().str, "loud");
    EXPECT_STREQ(Log::instance().getBacklogEntry(Log::instance().getBacklogSize() - 2).str,
                 "quiet");
}

TEST_F(KeelLog, BacklogReplayedOnInstall)
{
    NOTICE("before install");

    CapturingCallback late;
    Log::instance().installCallback(&late);
    Log::instance().removeCallback(&late);

    ASSERT_EQ(late.lines.size(), Log::instance().getBacklogSize());
    EXPECT_EQ(late.lines.back(), "(NN) before install\n");
}

TEST_F(KeelLog, BacklogIsBounded)
{
    for (size_t i = 0; i < LOG_BACKLOG + 10; ++i)
        NOTICE("entry " << i);

    EXPECT_EQ(Log::instance().getBacklogSize(), LOG_BACKLOG);
    EXPECT_STREQ(Log::instance().getBacklogEntry(0).str, "entry 10");
}

TEST(KeelLogDeathTest, FatalPanics)
{
    EXPECT_DEATH(FATAL("broken invariant"), "broken invariant");
}
