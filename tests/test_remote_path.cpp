#include <gtest/gtest.h>
#include <util/remote_path.hpp>
#include <util/string_utils.hpp>

TEST(RemotePath, NormalizeAnchorsRelativeInput) {
    EXPECT_EQ(RemotePath::normalize("home/user"), "/home/user");
    EXPECT_EQ(RemotePath::normalize(""), "/");
}

TEST(RemotePath, NormalizeCollapsesSeparatorsAndDots) {
    EXPECT_EQ(RemotePath::normalize("//srv///www/./html/"), "/srv/www/html");
    EXPECT_EQ(RemotePath::normalize("\\srv\\www"), "/srv/www");
}

TEST(RemotePath, DotDotNeverEscapesRoot) {
    EXPECT_EQ(RemotePath::normalize("/a/b/../c"), "/a/c");
    EXPECT_EQ(RemotePath::normalize("/../../etc"), "/etc");
    EXPECT_EQ(RemotePath::normalize(".."), "/");
}

TEST(RemotePath, JoinNormalizes) {
    EXPECT_EQ(RemotePath::join("/", "etc"), "/etc");
    EXPECT_EQ(RemotePath::join("/var/log/", "../tmp"), "/var/tmp");
}

TEST(RemotePath, ParentAndBasename) {
    EXPECT_EQ(RemotePath::parent("/a/b/c"), "/a/b");
    EXPECT_EQ(RemotePath::parent("/a"), "/");
    EXPECT_EQ(RemotePath::parent("/"), "/");
    EXPECT_EQ(RemotePath::basename("/a/b/c.txt"), "c.txt");
    EXPECT_EQ(RemotePath::basename("/"), "");
}

TEST(RemotePath, RelativeTo) {
    EXPECT_EQ(RemotePath::relative_to("/srv", "/srv/app/main.py"), "app/main.py");
    EXPECT_EQ(RemotePath::relative_to("/", "/etc/hosts"), "etc/hosts");
    EXPECT_EQ(RemotePath::relative_to("/srv", "/srv"), "");
    EXPECT_EQ(RemotePath::relative_to("/srv", "/srvx/file"), "");
}

TEST(StringUtils, FormatSize) {
    EXPECT_EQ(StringUtils::format_size(0), "0 B");
    EXPECT_EQ(StringUtils::format_size(512), "512 B");
    EXPECT_EQ(StringUtils::format_size(1536), "1.5 KB");
    EXPECT_EQ(StringUtils::format_size(5ull * 1024 * 1024), "5.0 MB");
}

TEST(StringUtils, UrlDecode) {
    EXPECT_EQ(StringUtils::url_decode("%2Fhome%2Fuser"), "/home/user");
    EXPECT_EQ(StringUtils::url_decode("a+b"), "a b");
    EXPECT_EQ(StringUtils::url_decode("a+b", false), "a+b");
    EXPECT_EQ(StringUtils::url_decode("100%"), "100%");
    EXPECT_EQ(StringUtils::url_decode("%zz"), "%zz");
}
