//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/support/DiagnosticsTests.cpp
// Purpose: Verify diagnostic collection, counting and printing with and
//          without a source manager.
// Key invariants: Diagnostics are printed in reporting order.
// Ownership/Lifetime: Engines and managers are local to each test.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace ember::support;

TEST(DiagnosticsTest, CountsBySeverity)
{
    DiagnosticEngine de;
    de.report(makeWarning({}, "slow"));
    de.report(makeError({}, "bad"));
    de.report(Diagnostic{Severity::Note, "fyi", {}});
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    ASSERT_EQ(de.diagnostics().size(), 3u);
    EXPECT_EQ(de.diagnostics()[2].message, "fyi");
}

TEST(DiagnosticsTest, PrintsPathLineAndColumn)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("src/./consts.em");
    DiagnosticEngine de;
    de.report(makeError({id, 4, 7}, "overflow"));
    de.report(makeWarning({id, 9, 0}, "slow"));
    de.report(makeError({0, 3, 0}, "no file"));
    de.report(makeError({}, "nowhere"));

    std::ostringstream os;
    de.printAll(os, &sm);
    EXPECT_EQ(os.str(),
              "src/consts.em:4:7: error: overflow\n"
              "src/consts.em:9: warning: slow\n"
              "line 3: error: no file\n"
              "error: nowhere\n");
}

TEST(SourceManagerTest, DeduplicatesNormalisedPaths)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("dir/file.em");
    const uint32_t b = sm.addFile("dir/../dir/file.em");
    const uint32_t c = sm.addFile("other.em");
    EXPECT_NE(a, 0u);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(sm.getPath(a), "dir/file.em");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(99).empty());

    EXPECT_TRUE((SourceLoc{a, 1, 1}.isValid()));
    EXPECT_FALSE(SourceLoc{}.isValid());
}
