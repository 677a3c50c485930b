#include <gtest/gtest.h>

#include "settings.hpp"

#include <cstdio>
#include <fstream>
#include <string>

namespace {

std::string write_temp(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream ofs(path);
    ofs << content;
    return path;
}

} // namespace

TEST(MemorySettings, GetSetRemove) {
    MemorySettings s;
    EXPECT_FALSE(s.get_string("username").has_value());
    EXPECT_EQ(s.get_string_or("username"), "");
    EXPECT_EQ(s.get_string_or("username", "anon"), "anon");

    s.set("username", "alice");
    EXPECT_EQ(s.get_string("username").value_or(""), "alice");

    s.remove("username");
    EXPECT_FALSE(s.get_string("username").has_value());
}

TEST(JsonSettings, LoadsStringMembers) {
    auto path = write_temp("madokami_settings_ok.json",
                           R"({"username": "alice", "password": "s3cret", "retries": 3})");
    JsonSettings s(path);
    EXPECT_TRUE(s.loaded());
    EXPECT_EQ(s.get_string_or("username"), "alice");
    EXPECT_EQ(s.get_string_or("password"), "s3cret");
    EXPECT_FALSE(s.get_string("retries").has_value());
    std::remove(path.c_str());
}

TEST(JsonSettings, MissingFileIsEmpty) {
    JsonSettings s(::testing::TempDir() + "madokami_settings_does_not_exist.json");
    EXPECT_FALSE(s.loaded());
    EXPECT_EQ(s.get_string_or("username"), "");
}

TEST(JsonSettings, MalformedFileIsEmpty) {
    auto path = write_temp("madokami_settings_bad.json", "{\"username\": ");
    JsonSettings s(path);
    EXPECT_FALSE(s.loaded());
    EXPECT_FALSE(s.get_string("username").has_value());
    std::remove(path.c_str());

    path = write_temp("madokami_settings_array.json", "[\"username\"]");
    JsonSettings arr(path);
    EXPECT_FALSE(arr.loaded());
    std::remove(path.c_str());
}
