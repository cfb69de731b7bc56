#ifndef SPELLFIX_MY_UTILS_HPP
#define SPELLFIX_MY_UTILS_HPP


#include <string>
#include <vector>
#include <filesystem>
#include <cstddef>


namespace fs = std::filesystem;


namespace spellfix{
    namespace myutils{
        // gzip is picked from the extension (.gz, any case)
        bool is_gzip_path(const fs::path& path);
        std::string read_file(const fs::path& path);
        void write_file(const fs::path& path, const std::string& data, bool gzipped);

        /*
        UTF-8 <-> code points. Bytes that are not part of a valid sequence are
        kept as U+DC80..U+DCFF and written back unchanged, so decoding then
        encoding any string gives the same bytes.
        */
        std::u32string to_code_points(const std::string& text);
        std::string to_utf8(const std::u32string& code_points);
        std::string to_utf8(char32_t code_point);
        size_t code_point_length(const std::string& text);
    } //namespace myutils

    namespace stringmanip{
        /*
        Words start and end with a word character (a unicode letter, digit or
        combining mark, or '_') and may hold apostrophes in between: "don't"
        stays whole, "'quoted'" becomes "quoted".
        */
        std::vector<std::string> split_words(const std::string& text);
        // unicode simple lower case mapping, one code point at a time
        void lower_case(std::string& sequence);
        std::string to_lower(std::string sequence);
        // a lone punctuation mark or a decimal number is not worth spell checking
        bool should_check(const std::string& word);
    } //namespace stringmanip
} //namespace spellfix



#endif // SPELLFIX_MY_UTILS_HPP
