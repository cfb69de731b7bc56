#ifndef SPELLFIX_DICTIONARY_IO_HPP
#define SPELLFIX_DICTIONARY_IO_HPP


#include <string>
#include <filesystem>
#include "vocab/word_frequency.hpp"


namespace fs = std::filesystem;

/*
Moves word frequency lists between disk and the vocabulary.
Dictionaries are json objects mapping each word to its count, e.g.
    {"happening": 100, "henning": 10}
optionally gzip compressed (the file name ends with .gz).
*/


namespace spellfix{
    namespace io{

// merges the dictionary at path into word_frequency; returns the number of entries read
size_t load_dictionary(const fs::path& path, vocab::WordFrequency& word_frequency);
size_t load_dictionary_from_string(const std::string& json_text, vocab::WordFrequency& word_frequency);

// tokenizes free text and counts every token once per occurrence
size_t load_text(const std::string& text, vocab::WordFrequency& word_frequency);
size_t load_text_file(const fs::path& path, vocab::WordFrequency& word_frequency);

std::string dump_dictionary(const vocab::WordFrequency& word_frequency);
void export_dictionary(const fs::path& path, const vocab::WordFrequency& word_frequency, bool gzipped = true);

// <resources_dir>/<language>.json.gz, falling back to <language>.json
fs::path language_dictionary_path(const fs::path& resources_dir, const std::string& language);


    } // namespace io
} // namespace spellfix


#endif // SPELLFIX_DICTIONARY_IO_HPP
