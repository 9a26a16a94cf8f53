#include <doctest/doctest.h>
#include <securepath/secure_join.hpp>

#include "../test_helpers.hpp"

#include <filesystem>
#include <string>

#include <unistd.h>

using securepath::JoinError;
using securepath::JoinEvent;
using securepath::JoinTrace;
using securepath::secure_join;
using securepath::secure_join_checked;

// ============================================================================
// Lexical resolution (root does not exist)
// ============================================================================

TEST_CASE("rootfs does not exist") {
    CHECK(secure_join("/home/rootfs", "a/b/c") == "/home/rootfs/a/b/c");
}

TEST_CASE("leading dotdot segments are dropped") {
    CHECK(secure_join("/home/rootfs", "../../../a/b/c") == "/home/rootfs/a/b/c");
}

TEST_CASE("skip any dotdot") {
    CHECK(secure_join("/home/rootfs", "../../../a/../../b/../../c") == "/home/rootfs/a/b/c");
}

TEST_CASE("rootfs is empty") {
    CHECK(secure_join("", "") == "/");
    CHECK(secure_join("", "a/b") == "/a/b");
}

TEST_CASE("empty unsafe path returns rootfs with trailing separator") {
    CHECK(secure_join("/home/rootfs", "") == "/home/rootfs/");
}

TEST_CASE("absolute unsafe path stays under rootfs") {
    CHECK(secure_join("/home/rootfs", "/etc/passwd") == "/home/rootfs/etc/passwd");
    CHECK(secure_join("/home/rootfs", "//etc//passwd") == "/home/rootfs/etc/passwd");
}

TEST_CASE("leading dot segment is kept, interior ones are dropped") {
    CHECK(secure_join("/home/rootfs", "./a/./b/.") == "/home/rootfs/./a/b");
    CHECK(secure_join("/home/rootfs", "./a") == "/home/rootfs/./a");
    CHECK(secure_join("/home/rootfs", ".") == "/home/rootfs/.");
    CHECK(secure_join("/home/rootfs", "a/./b") == "/home/rootfs/a/b");
}

TEST_CASE("dotdot after a leading dot drops both") {
    CHECK(secure_join("/home/rootfs", "./../a") == "/home/rootfs/a");
}

TEST_CASE("trailing dotdot is dropped") {
    CHECK(secure_join("/home/rootfs", "a/b/..") == "/home/rootfs/a/b");
}

TEST_CASE("re-resolving a resolved path is idempotent") {
    auto first = secure_join("/home/rootfs", "../x/./y//z");
    REQUIRE(first == "/home/rootfs/x/y/z");
    CHECK(secure_join("", first) == first);
    CHECK(secure_join("", secure_join("", first)) == first);
}

// ============================================================================
// Symlinks inside a real rootfs
// ============================================================================

TEST_CASE("relative softlink beyond container rootfs") {
    TempTestDir rootfs;
    rootfs.symlink("../../../", "1");

    CHECK(secure_join(rootfs.path, "1") == rootfs.path);
}

TEST_CASE("abs softlink points to the non-exist directory") {
    TempTestDir rootfs;
    rootfs.symlink("/dddd", "2");

    CHECK(secure_join(rootfs.path, "2") == rootfs.path + "/dddd");
}

TEST_CASE("abs softlink points to the root") {
    TempTestDir rootfs;
    rootfs.symlink("/", "3");

    CHECK(secure_join(rootfs.path, "3") == rootfs.path + "/");
}

TEST_CASE("resolution continues from rootfs after an escape") {
    TempTestDir rootfs;
    rootfs.symlink("../../../", "1");

    CHECK(secure_join(rootfs.path, "1/etc/passwd") == rootfs.path + "/etc/passwd");
}

TEST_CASE("relative softlink inside rootfs is canonicalized") {
    TempTestDir rootfs;
    rootfs.mkdir("usr/lib");
    rootfs.symlink("usr/lib", "lib");

    CHECK(secure_join(rootfs.path, "lib/libc.so") == rootfs.path + "/usr/lib/libc.so");
}

TEST_CASE("relative softlink with dotdot that stays inside rootfs") {
    TempTestDir rootfs;
    rootfs.mkdir("a");
    rootfs.mkdir("c");
    rootfs.symlink("../c", "a/link");

    CHECK(secure_join(rootfs.path, "a/link") == rootfs.path + "/c");
}

TEST_CASE("relative softlink to missing target is joined lexically") {
    TempTestDir rootfs;
    rootfs.symlink("missing/x", "l");

    CHECK(secure_join(rootfs.path, "l") == rootfs.path + "/missing/x");
}

TEST_CASE("absolute softlink is re-rooted and resolution continues") {
    TempTestDir rootfs;
    rootfs.mkdir("etc");
    rootfs.symlink("/usr/etc", "etc/conf");

    CHECK(secure_join(rootfs.path, "etc/conf/app.ini") == rootfs.path + "/usr/etc/app.ini");
}

TEST_CASE("relative softlink through an absolute softlink escapes and is clamped") {
    TempTestDir rootfs;
    rootfs.symlink("/", "b");
    rootfs.symlink("b", "a");

    // rootfs/b exists on the host as "/", which is outside rootfs
    CHECK(secure_join(rootfs.path, "a") == rootfs.path);
}

// ============================================================================
// Tracing
// ============================================================================

TEST_CASE("trace records clamped escapes") {
    TempTestDir rootfs;
    rootfs.symlink("../../../", "1");

    JoinTrace trace;
    auto result = secure_join(rootfs.path, "1", &trace);

    CHECK(result == rootfs.path);
    CHECK(trace.count(JoinEvent::relative_link_followed) == 1);
    CHECK(trace.escape_count() == 3);
    CHECK(trace.has_escapes());
}

TEST_CASE("trace records absolute link re-rooting") {
    TempTestDir rootfs;
    rootfs.symlink("/dddd", "2");

    JoinTrace trace;
    secure_join(rootfs.path, "2", &trace);

    REQUIRE(trace.count(JoinEvent::absolute_link_reclamped) == 1);
    CHECK_FALSE(trace.has_escapes());
    for (const auto& e : trace.entries()) {
        if (e.event == JoinEvent::absolute_link_reclamped) {
            CHECK(e.component == "2");
            CHECK(e.path == rootfs.path + "/dddd");
        }
    }
}

TEST_CASE("trace records lexical decisions") {
    JoinTrace trace;
    auto result = secure_join("/home/rootfs", "/../../a", &trace);

    CHECK(result == "/home/rootfs/a");
    CHECK(trace.count(JoinEvent::root_marker_skipped) == 1);
    CHECK(trace.count(JoinEvent::dotdot_dropped) == 2);
    CHECK_FALSE(trace.has_escapes());
}

TEST_CASE("tracing does not change the result") {
    TempTestDir rootfs;
    rootfs.mkdir("usr/lib");
    rootfs.symlink("usr/lib", "lib");
    rootfs.symlink("../../../", "1");

    for (const char* p : {"lib/x", "1/y", "../z", "/a/../b"}) {
        JoinTrace trace;
        CHECK(secure_join(rootfs.path, p, &trace) == secure_join(rootfs.path, p));
    }
}

TEST_CASE("unreadable component is joined and traced") {
    TempTestDir rootfs;
    // Longer than NAME_MAX, so lstat fails with ENAMETOOLONG
    std::string long_name(300, 'n');

    JoinTrace trace;
    auto result = secure_join(rootfs.path, long_name, &trace);

    CHECK(result == rootfs.path + "/" + long_name);
    CHECK(trace.count(JoinEvent::link_query_failed) == 1);
    CHECK_FALSE(trace.has_escapes());
    CHECK(secure_join(rootfs.path, long_name) == result);
}

#ifdef __linux__
TEST_CASE("existing step that cannot be canonicalized is kept") {
    if (!std::filesystem::exists("/proc/self/fd")) {
        return;
    }

    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    TempTestDir rootfs;
    // fdlink exists through the pipe, but its magic-link target "pipe:[N]" does not
    rootfs.symlink("/proc/self/fd/" + std::to_string(fds[0]), "fdlink");
    rootfs.symlink("fdlink", "l");

    JoinTrace trace;
    auto result = secure_join(rootfs.path, "l", &trace);

    ::close(fds[0]);
    ::close(fds[1]);

    CHECK(result == rootfs.path + "/fdlink");
    CHECK(trace.count(JoinEvent::relative_link_followed) == 1);
    CHECK(trace.count(JoinEvent::canonicalize_failed) == 1);
    CHECK(trace.count(JoinEvent::link_canonicalized) == 0);
    CHECK_FALSE(trace.has_escapes());
}
#endif

// ============================================================================
// Checked join
// ============================================================================

TEST_CASE("checked join resolves valid input") {
    auto r = secure_join_checked("/home/rootfs", "../a/b");
    REQUIRE(r.ok);
    CHECK(r.path == "/home/rootfs/a/b");
    CHECK(r.error == JoinError::None);
}

TEST_CASE("checked join rejects NUL bytes") {
    std::string bad = std::string("etc/\0passwd", 11);
    auto r = secure_join_checked("/home/rootfs", bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error == JoinError::ContainsNul);
    CHECK(r.path.empty());

    auto r2 = secure_join_checked(std::string("/home\0", 6), "a");
    CHECK(r2.error == JoinError::ContainsNul);
}

TEST_CASE("checked join rejects invalid UTF-8") {
    auto r = secure_join_checked("/home/rootfs", "a/\xff/b");
    CHECK_FALSE(r.ok);
    CHECK(r.error == JoinError::InvalidEncoding);

    auto r2 = secure_join_checked("/home/\xc0\xaf", "a");
    CHECK(r2.error == JoinError::InvalidEncoding);
}

TEST_CASE("checked join accepts non-ASCII UTF-8") {
    auto r = secure_join_checked("/home/rootfs", "donn\xc3\xa9" "es/../x");
    REQUIRE(r.ok);
    CHECK(r.path == "/home/rootfs/donn\xc3\xa9" "es/x");
}

TEST_CASE("checked join fills the trace") {
    TempTestDir rootfs;
    rootfs.symlink("../../../", "1");

    JoinTrace trace;
    auto r = secure_join_checked(rootfs.path, "1", &trace);
    REQUIRE(r.ok);
    CHECK(r.path == rootfs.path);
    CHECK(trace.has_escapes());
}
