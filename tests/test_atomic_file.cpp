#include "io/atomic_file.hpp"
#include "util/path_utils.hpp"
#include "testing.hpp"

#include <dirent.h>
#include <gtest/gtest.h>
#include <string>

namespace {

int CountEntries(const std::string& dir) {
    int n = 0;
    DIR* d = ::opendir(dir.c_str());
    if (!d)
        return -1;
    while (dirent* e = ::readdir(d)) {
        const std::string name = e->d_name;
        if (name != "." && name != "..")
            ++n;
    }
    ::closedir(d);
    return n;
}

TEST(AtomicFileTests, WriteReplacesContent) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.File("state.json");

    ASSERT_TRUE(imagine::WriteFileAtomically(p, "first").is_ok());
    ASSERT_TRUE(imagine::WriteFileAtomically(p, "second").is_ok());

    EXPECT_EQ(testutil::AsString(testutil::ReadFile(p)), "second");
    EXPECT_EQ(CountEntries(tmp.Path()), 1);
}

TEST(AtomicFileTests, UncommittedTempFileIsRemoved) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.File("never.json");

    {
        imagine::TempFile t;
        ASSERT_TRUE(imagine::TempFile::CreateBeside(p, t).is_ok());
        EXPECT_TRUE(testutil::Exists(t.Path()));
        EXPECT_EQ(imagine::DirName(t.Path()), tmp.Path());
    }

    EXPECT_EQ(CountEntries(tmp.Path()), 0);
    EXPECT_FALSE(testutil::Exists(p));
}

TEST(AtomicFileTests, MissingDirectoryFails) {
    testutil::TemporaryDirectory tmp;
    auto r = imagine::WriteFileAtomically(tmp.File("no/such/dir/file"), "x");
    EXPECT_FALSE(r.is_ok());
}

} // namespace
