#include <gtest/gtest.h>
#include "io/dictionary_io.hpp"
#include "utils/my_utils.hpp"
#include <filesystem>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace spellfix;


class dictionaryIoTest : public testing::Test{
protected:
    dictionaryIoTest(){
        output_dir = fs::temp_directory_path() / ("spellfix_io_test_" + std::to_string(::getpid()));
        fs::create_directories(output_dir);
    };
    ~dictionaryIoTest(){
        std::error_code ec;
        fs::remove_all(output_dir, ec);
    }

    fs::path dictionary_dir(){
        char* project_root_ptr = std::getenv("PROJECT_ROOT");
        if (!project_root_ptr){
            throw std::runtime_error("PROJECT_ROOT environement varibale not set.");
        }
        return fs::path(project_root_ptr) / "data" / "dictionary";
    }

    fs::path output_dir;
    vocab::WordFrequency word_frequency{};
};


TEST_F(dictionaryIoTest, loads_json_dictionary){
    size_t num_entries = io::load_dictionary(dictionary_dir() / "test_dictionary.json", word_frequency);
    EXPECT_EQ(num_entries, 12u);
    EXPECT_EQ(word_frequency.query("happening"), 100u);
    EXPECT_EQ(word_frequency.query("the"), 300u);
    EXPECT_EQ(word_frequency.total_words(), 554u);
}


TEST_F(dictionaryIoTest, handles_missing_file){
    EXPECT_THROW(io::load_dictionary(dictionary_dir() / "dummy.json", word_frequency), std::runtime_error);
    EXPECT_EQ(word_frequency.unique_word_count(), 0u);
}


TEST_F(dictionaryIoTest, rejects_non_positive_counts_in_file){
    EXPECT_THROW(io::load_dictionary(dictionary_dir() / "bad_count.json", word_frequency), vocab::invalidCount);
    EXPECT_FALSE(word_frequency.contains("hello")) << "a rejected file must not be partially loaded";
}


TEST_F(dictionaryIoTest, rejects_non_integer_counts){
    EXPECT_THROW(io::load_dictionary_from_string(R"({"pi": 3.14})", word_frequency), vocab::invalidCount);
    EXPECT_THROW(io::load_dictionary_from_string(R"({"word": "five"})", word_frequency), vocab::invalidCount);
    EXPECT_THROW(io::load_dictionary_from_string(R"({"flag": true})", word_frequency), vocab::invalidCount);
}


TEST_F(dictionaryIoTest, rejects_malformed_documents){
    EXPECT_THROW(io::load_dictionary(dictionary_dir() / "not_an_object.json", word_frequency), std::runtime_error);
    EXPECT_THROW(io::load_dictionary_from_string("{\"open\": 1", word_frequency), std::runtime_error);
}


TEST_F(dictionaryIoTest, lower_cases_keys_when_insensitive){
    io::load_dictionary_from_string(R"({"The": 2, "the": 3})", word_frequency);
    EXPECT_EQ(word_frequency.query("the"), 5u);
    EXPECT_EQ(word_frequency.unique_word_count(), 1u);
}


TEST_F(dictionaryIoTest, loads_text_file_tokens){
    size_t num_tokens = io::load_text_file(dictionary_dir() / "sample_text.txt", word_frequency);
    EXPECT_EQ(num_tokens, 21u);
    EXPECT_EQ(word_frequency.query("the"), 4u);
    EXPECT_EQ(word_frequency.query("dog"), 2u);
    EXPECT_EQ(word_frequency.query("didn't"), 1u);
    EXPECT_EQ(word_frequency.query("home"), 1u);
    EXPECT_EQ(word_frequency.total_words(), 21u);
}


TEST_F(dictionaryIoTest, dump_has_sorted_keys){
    word_frequency.add("zebra", 1);
    word_frequency.add("apple", 2);
    EXPECT_EQ(io::dump_dictionary(word_frequency), R"({"apple":2,"zebra":1})");
}


TEST_F(dictionaryIoTest, exported_gzip_dictionary_reloads){
    io::load_dictionary(dictionary_dir() / "test_dictionary.json", word_frequency);
    fs::path export_path = output_dir / "exported.json.gz";
    io::export_dictionary(export_path, word_frequency, true);
    ASSERT_TRUE(fs::exists(export_path));

    vocab::WordFrequency reloaded{};
    io::load_dictionary(export_path, reloaded);
    for (const auto& word : word_frequency.unique_words()){
        EXPECT_EQ(reloaded.query(word), word_frequency.query(word)) << word;
    }
    EXPECT_EQ(reloaded.total_words(), word_frequency.total_words());
}


TEST_F(dictionaryIoTest, exported_plain_dictionary_reloads){
    word_frequency.add("morning", 50);
    fs::path export_path = output_dir / "exported.json";
    io::export_dictionary(export_path, word_frequency, false);
    EXPECT_EQ(myutils::read_file(export_path), R"({"morning":50})");

    vocab::WordFrequency reloaded{};
    io::load_dictionary(export_path, reloaded);
    EXPECT_EQ(reloaded.query("morning"), 50u);
}


TEST_F(dictionaryIoTest, resolves_language_files){
    fs::path resources_dir = dictionary_dir().parent_path() / "resources";
    EXPECT_EQ(io::language_dictionary_path(resources_dir, "EN"), resources_dir / "en.json");
    EXPECT_THROW(io::language_dictionary_path(resources_dir, "xx"), std::invalid_argument);
}
