#include <gtest/gtest.h>

#include <cstring> // for std::strlen
#include <sstream>
#include <string>

#include "osstring/path_string.hpp"

using namespace osstring;
using namespace std::literals;

TEST(path_string, default_construction)
{
    EXPECT_NO_THROW(path_string());
    EXPECT_TRUE(path_string().get().empty());
    EXPECT_STREQ(path_string().c_str(), "");
}

TEST(path_string, to_path_string)
{
    const auto path = to_path_string("/usr/bin");
    EXPECT_EQ(path.size(), 8u);
    EXPECT_EQ(path, "/usr/bin");
    EXPECT_NO_THROW(to_path_string(""));
    EXPECT_NO_THROW(to_path_string("relative/path with spaces"));
    EXPECT_NO_THROW(to_path_string("--flag=value"));
}

TEST(path_string, to_path_string_with_nul)
{
    try {
        (void) to_path_string("/usr\0bin"s);
        FAIL() << "expected exception";
    }
    catch (const invalid_content_error& ex) {
        EXPECT_EQ(ex.badchar(), '\0');
        EXPECT_EQ(ex.position(), 4u);
        EXPECT_EQ(std::string(ex.what()),
                  "may not contain '\\0', character denied at position 4");
    }
    EXPECT_THROW((void) to_path_string(std::string{'\0'}),
                 invalid_content_error);
    EXPECT_THROW((void) to_path_string("trailing\0"s), invalid_content_error);
}

TEST(path_string, construction_from_array_with_nul)
{
    try {
        (void) path_string{"/usr\0bin"};
        FAIL() << "expected exception";
    }
    catch (const invalid_content_error& ex) {
        EXPECT_EQ(ex.badchar(), '\0');
        EXPECT_EQ(ex.position(), 4u);
    }
    EXPECT_THROW((void) path_string{"\0"}, invalid_content_error);
    EXPECT_THROW((void) path_string{"trailing\0"}, invalid_content_error);
    const char buffer[] = {'a', '\0', 'b'};
    EXPECT_THROW((void) path_string{buffer}, invalid_content_error);
}

TEST(path_string, construction_from_array)
{
    const auto path = path_string{"/usr/bin"};
    EXPECT_EQ(path.size(), 8u);
    EXPECT_EQ(path, "/usr/bin");
    const char unterminated[] = {'a', 'b'};
    EXPECT_EQ(path_string{unterminated}, "ab");
}

TEST(path_string, construction_from_pointer)
{
    const char *pointer = "/usr/bin";
    EXPECT_EQ(path_string{pointer}, "/usr/bin");
}

TEST(path_string, round_trip)
{
    auto input = std::string{};
    for (auto i = 1; i < 256; ++i) {
        input += static_cast<char>(i);
    }
    const auto path = to_path_string(input);
    ASSERT_EQ(path.size(), input.size());
    for (auto i = 0u; i < input.size(); ++i) {
        EXPECT_EQ(path.at(i), input[i]);
    }
}

TEST(path_string, c_str_is_whole_content)
{
    const auto path = to_path_string("/tmp/some file");
    EXPECT_EQ(std::strlen(path.c_str()), path.size());
}

TEST(path_string, filter)
{
    const auto path = path_string::filter("ab\0c\0d"s);
    EXPECT_EQ(path, "abcd");
    EXPECT_EQ(path.size(), 4u);
}

TEST(path_string, append_nul_char)
{
    auto path = to_path_string("abc");
    try {
        path.append('\0');
        FAIL() << "expected exception";
    }
    catch (const invalid_character_error& ex) {
        EXPECT_EQ(ex.badchar(), '\0');
    }
    EXPECT_EQ(path.size(), 3u);
    EXPECT_EQ(path, "abc");
}

TEST(path_string, append_string_with_nul)
{
    auto path = to_path_string("/usr");
    EXPECT_THROW(path.append("/lo\0cal"s), invalid_character_error);
    EXPECT_EQ(path.size(), 4u);
    EXPECT_EQ(path, "/usr");
    EXPECT_NO_THROW(path.append("/local"s));
    EXPECT_EQ(path, "/usr/local");
    path += to_path_string("/bin");
    EXPECT_EQ(path, "/usr/local/bin");
}

TEST(path_string, append_array_with_nul)
{
    auto path = to_path_string("abc");
    EXPECT_THROW(path.append("de\0f"), invalid_character_error);
    EXPECT_EQ(path.size(), 3u);
    EXPECT_EQ(path, "abc");
    EXPECT_THROW(path += "\0", invalid_character_error);
    EXPECT_EQ(path, "abc");
    path += "def";
    EXPECT_EQ(path, "abcdef");
}

TEST(path_string, equality_with_array_with_nul)
{
    const auto path = to_path_string("/usr");
    EXPECT_FALSE(path == "/usr\0bin");
    EXPECT_FALSE("/usr\0bin" == path);
    EXPECT_TRUE(path == "/usr");
}

TEST(path_string, set)
{
    auto path = to_path_string("abc");
    EXPECT_NO_THROW(path.set(1u, 'X'));
    EXPECT_EQ(path, "aXc");
}

TEST(path_string, set_nul)
{
    auto path = to_path_string("abc");
    EXPECT_THROW(path.set(1u, '\0'), invalid_character_error);
    EXPECT_EQ(path, "abc");
}

TEST(path_string, ostream_operator_support)
{
    std::stringstream os;
    os << to_path_string("/usr/bin");
    EXPECT_EQ(os.str(), "/usr/bin");
}
