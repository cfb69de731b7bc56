#ifndef SPELLFIX_SPELL_CORRECTOR_HPP
#define SPELLFIX_SPELL_CORRECTOR_HPP


#include <string>
#include <vector>
#include <set>
#include <memory>
#include <optional>
#include <utility>
#include <filesystem>
#include "vocab/word_frequency.hpp"
#include "edits/candidate_generator.hpp"


namespace fs = std::filesystem;


namespace spellfix{
    namespace correctors{


constexpr int DEFAULT_EDIT_DISTANCE = 2;
constexpr size_t DEFAULT_MAX_DISTANCE2_LENGTH = 20;


struct correctorConfig{
    // search settings
    int distance = DEFAULT_EDIT_DISTANCE; // 1 or 2
    size_t max_distance2_length = DEFAULT_MAX_DISTANCE2_LENGTH; // longer words only get distance 1
    bool skip_unchecked_tokens = true; // numbers and lone punctuation count as known

    // vocabulary settings
    bool case_sensitive = false;
    std::optional<vocab::wordCount> threshold;

    // dictionaries loaded at construction. local_dictionary wins over languages
    std::vector<std::string> languages;
    fs::path resources_dir = "resources";
    fs::path local_dictionary;

    // setters
    void set_distance(int new_distance){distance = new_distance;}
    void set_languages(std::vector<std::string> new_languages){languages = std::move(new_languages);}
    void set_local_dictionary(const fs::path& path){local_dictionary = path;}
};


class SpellCorrector{
public:
    typedef std::set<std::string> WordSet;
    typedef std::vector<std::pair<std::string, double>> RankedWords;

public:
    SpellCorrector();
    explicit SpellCorrector(correctorConfig config);
    SpellCorrector(std::shared_ptr<vocab::WordFrequency> word_frequency, correctorConfig config);
    explicit SpellCorrector(std::shared_ptr<vocab::WordFrequency> word_frequency);
    ~SpellCorrector();

    // getters
    int get_distance() const {return distance_;}
    const correctorConfig& get_config() const {return config_;}
    vocab::WordFrequency& word_frequency(){return *word_frequency_;}
    const vocab::WordFrequency& word_frequency() const {return *word_frequency_;}
    std::shared_ptr<vocab::WordFrequency> get_word_frequency_ptr() const {return word_frequency_;}

    // setters
    void set_distance(int distance);

    // lookup
    bool contains(const std::string& word) const;
    vocab::wordCount frequency(const std::string& word) const;
    double word_probability(const std::string& word) const;
    double word_probability(const std::string& word, vocab::wordCount total_words) const;
    WordSet known(const std::vector<std::string>& words) const;
    WordSet unknown(const std::vector<std::string>& words) const;

    // correction
    std::optional<WordSet> candidates(const std::string& word) const;
    std::optional<RankedWords> ranked_candidates(const std::string& word) const;
    std::optional<std::string> correction(const std::string& word) const;

    // edits over the vocabulary alphabet
    edits::EditSet edit_distance_1(const std::string& word) const;
    edits::EditSet edit_distance_2(const std::string& word) const;

    // external
    static std::vector<std::string> split_words(const std::string& text);
    void export_dictionary(const fs::path& path, bool gzipped = true) const;

private:
    void load_dictionaries();
    bool should_check(const std::string& key) const;
    bool is_known_key(const std::string& key) const;
    bool allows_distance2(const std::string& key) const;
    WordSet search(const std::string& key, int distance) const;

private:
    correctorConfig config_;
    std::shared_ptr<vocab::WordFrequency> word_frequency_;
    int distance_ = DEFAULT_EDIT_DISTANCE;
};


    } // namespace correctors
} // namespace spellfix


#endif // SPELLFIX_SPELL_CORRECTOR_HPP
