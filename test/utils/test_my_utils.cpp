#include <gtest/gtest.h>
#include "utils/my_utils.hpp"
#include <string>
#include <vector>

using namespace spellfix;


TEST(stringManipTest, split_words_drops_punctuation){
    auto words = stringmanip::split_words("This is a test, of the 'splitting' function!");
    std::vector<std::string> expected{"This", "is", "a", "test", "of", "the", "splitting", "function"};
    EXPECT_EQ(words, expected);
}


TEST(stringManipTest, split_words_keeps_inner_apostrophes){
    auto words = stringmanip::split_words("don't stop rock'n'roll''");
    std::vector<std::string> expected{"don't", "stop", "rock'n'roll"};
    EXPECT_EQ(words, expected);
}


TEST(stringManipTest, split_words_keeps_numbers_and_non_ascii){
    auto words = stringmanip::split_words("caf\xC3\xA9 at 10:30");
    std::vector<std::string> expected{"caf\xC3\xA9", "at", "10", "30"};
    EXPECT_EQ(words, expected);
    EXPECT_TRUE(stringmanip::split_words("  ,.;  ").empty());
}


TEST(stringManipTest, split_words_drops_non_ascii_punctuation){
    auto words = stringmanip::split_words("\xC2\xAB" "caf\xC3\xA9" "\xC2\xBB ni\xC3\xB1o");
    std::vector<std::string> expected{"caf\xC3\xA9", "ni\xC3\xB1o"};
    EXPECT_EQ(words, expected);
}


TEST(stringManipTest, lower_case_is_idempotent){
    std::string word = "HeLLo";
    stringmanip::lower_case(word);
    EXPECT_EQ(word, "hello");
    EXPECT_EQ(stringmanip::to_lower(word), word);
}


TEST(stringManipTest, lower_case_folds_non_ascii_letters){
    EXPECT_EQ(stringmanip::to_lower("NI\xC3\x91O"), "ni\xC3\xB1o");
    EXPECT_EQ(stringmanip::to_lower("\xC3\x89T\xC3\x89"), "\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(stringmanip::to_lower("ni\xC3\xB1o"), "ni\xC3\xB1o");
    // stray bytes pass through untouched
    EXPECT_EQ(stringmanip::to_lower("AB\xFF"), "ab\xFF");
}


TEST(stringManipTest, should_check_skips_numbers_and_lone_punctuation){
    EXPECT_FALSE(stringmanip::should_check("!"));
    EXPECT_FALSE(stringmanip::should_check("12"));
    EXPECT_FALSE(stringmanip::should_check("-3.5e2"));
    EXPECT_TRUE(stringmanip::should_check("word"));
    EXPECT_TRUE(stringmanip::should_check("12th"));
    EXPECT_TRUE(stringmanip::should_check("!!"));
}


TEST(stringManipTest, should_check_only_skips_decimal_numbers){
    EXPECT_TRUE(stringmanip::should_check("0x1f"));
    EXPECT_TRUE(stringmanip::should_check("0X1F"));
    EXPECT_TRUE(stringmanip::should_check("+-5"));
    EXPECT_TRUE(stringmanip::should_check("3,5"));
    EXPECT_FALSE(stringmanip::should_check("+5"));
    EXPECT_FALSE(stringmanip::should_check(".5"));
}


TEST(utf8Test, decodes_code_points){
    EXPECT_EQ(myutils::to_code_points("ni\xC3\xB1o"), std::u32string(U"ni\u00F1o"));
    EXPECT_EQ(myutils::code_point_length("ni\xC3\xB1o"), 4u);
    EXPECT_EQ(myutils::code_point_length(""), 0u);
    EXPECT_EQ(myutils::to_utf8(U'\u00F1'), "\xC3\xB1");
    EXPECT_EQ(myutils::to_utf8(std::u32string(U"ni\u00F1o")), "ni\xC3\xB1o");
}


TEST(utf8Test, invalid_bytes_survive_a_round_trip){
    const std::string broken = "nin\xC3";
    auto code_points = myutils::to_code_points(broken);
    EXPECT_EQ(code_points.size(), 4u);
    EXPECT_EQ(myutils::to_utf8(code_points), broken);

    const std::string stray = "\xFF" "ab\x80";
    EXPECT_EQ(myutils::to_utf8(myutils::to_code_points(stray)), stray);
}


TEST(fileUtilsTest, detects_gzip_extension){
    EXPECT_TRUE(myutils::is_gzip_path("en.json.gz"));
    EXPECT_TRUE(myutils::is_gzip_path("EN.JSON.GZ"));
    EXPECT_FALSE(myutils::is_gzip_path("en.json"));
}


TEST(fileUtilsTest, missing_file_throws){
    EXPECT_THROW(myutils::read_file("/nonexistent/spellfix/words.txt"), std::runtime_error);
}
