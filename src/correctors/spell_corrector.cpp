#include "correctors/spell_corrector.hpp"
#include "io/dictionary_io.hpp"
#include "utils/my_utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <glog/logging.h>


namespace spellfix{
    namespace correctors{


SpellCorrector::SpellCorrector() : SpellCorrector(correctorConfig{}){}


SpellCorrector::SpellCorrector(correctorConfig config) :
 config_(std::move(config)),
 word_frequency_(std::make_shared<vocab::WordFrequency>(config_.case_sensitive, config_.threshold)){
    set_distance(config_.distance);
    load_dictionaries();
    LOG(INFO) << "[SpellCorrector/constructor]: instance created. distance: " << distance_
              << ", vocabulary size: " << word_frequency_->unique_word_count();
}


SpellCorrector::SpellCorrector(std::shared_ptr<vocab::WordFrequency> word_frequency, correctorConfig config) :
 config_(std::move(config)), word_frequency_(std::move(word_frequency)){
    if (!word_frequency_){
        LOG(WARNING) << "[SpellCorrector/constructor]: received an empty word frequency pointer";
        throw std::invalid_argument("SpellCorrector needs a word frequency instance");
    }
    if (config_.case_sensitive != word_frequency_->is_case_sensitive()){
        LOG(WARNING) << "[SpellCorrector/constructor]: config case sensitivity is ignored, "
                     << "the shared vocabulary decides (case sensitive: " << word_frequency_->is_case_sensitive() << ")";
        config_.case_sensitive = word_frequency_->is_case_sensitive();
    }
    set_distance(config_.distance);
    load_dictionaries();
    LOG(INFO) << "[SpellCorrector/constructor]: instance created on a shared vocabulary. distance: " << distance_
              << ", vocabulary size: " << word_frequency_->unique_word_count();
}


SpellCorrector::SpellCorrector(std::shared_ptr<vocab::WordFrequency> word_frequency) :
 SpellCorrector(word_frequency, correctorConfig{}){}


SpellCorrector::~SpellCorrector(){
    DLOG(INFO) << "[SpellCorrector/destructor]: instance is out of scope";
}


void SpellCorrector::load_dictionaries(){
    if (!config_.local_dictionary.empty()){
        io::load_dictionary(config_.local_dictionary, *word_frequency_);
        return;
    }
    for (const auto& language : config_.languages){
        io::load_dictionary(io::language_dictionary_path(config_.resources_dir, language), *word_frequency_);
    }
}


void SpellCorrector::set_distance(int distance){
    if (distance != 1 && distance != 2){
        LOG(WARNING) << "[SpellCorrector/set_distance]: invalid distance " << distance
                     << ", falling back to " << DEFAULT_EDIT_DISTANCE;
        distance = DEFAULT_EDIT_DISTANCE;
    }
    distance_ = distance;
    config_.distance = distance;
}


bool SpellCorrector::should_check(const std::string& key) const {
    return !config_.skip_unchecked_tokens || stringmanip::should_check(key);
}


bool SpellCorrector::is_known_key(const std::string& key) const {
    return word_frequency_->contains_normalized(key);
}


bool SpellCorrector::allows_distance2(const std::string& key) const {
    if (myutils::code_point_length(key) > config_.max_distance2_length){
        VLOG(2) << "[SpellCorrector/allows_distance2]: " << key << " is longer than "
                << config_.max_distance2_length << ", searching distance 1 only";
        return false;
    }
    return true;
}


bool SpellCorrector::contains(const std::string& word) const {
    return word_frequency_->contains(word);
}


vocab::wordCount SpellCorrector::frequency(const std::string& word) const {
    return word_frequency_->query(word);
}


double SpellCorrector::word_probability(const std::string& word) const {
    return word_frequency_->word_usage_frequency(word);
}


double SpellCorrector::word_probability(const std::string& word, vocab::wordCount total_words) const {
    if (total_words == 0){
        return 0.0;
    }
    return static_cast<double>(word_frequency_->query(word)) / static_cast<double>(total_words);
}


SpellCorrector::WordSet SpellCorrector::known(const std::vector<std::string>& words) const {
    WordSet result;
    for (const auto& word : words){
        std::string key = word_frequency_->normalize(word);
        if (!should_check(key) || is_known_key(key)){
            result.insert(key);
        }
    }
    return result;
}


SpellCorrector::WordSet SpellCorrector::unknown(const std::vector<std::string>& words) const {
    WordSet result;
    for (const auto& word : words){
        std::string key = word_frequency_->normalize(word);
        if (should_check(key) && !is_known_key(key)){
            result.insert(key);
        }
    }
    return result;
}


edits::EditSet SpellCorrector::edit_distance_1(const std::string& word) const {
    std::string key = word_frequency_->normalize(word);
    if (!should_check(key)){
        return edits::EditSet{key};
    }
    return edits::edits1(key, word_frequency_->letters());
}


edits::EditSet SpellCorrector::edit_distance_2(const std::string& word) const {
    std::string key = word_frequency_->normalize(word);
    if (!should_check(key)){
        return edits::EditSet{key};
    }
    return edits::edits2(key, word_frequency_->letters());
}


SpellCorrector::WordSet SpellCorrector::search(const std::string& key, int distance) const {
    const std::string alphabet = word_frequency_->letters();
    auto is_known = [this](const std::string& candidate){return is_known_key(candidate);};

    auto known1 = edits::known_edits1(key, alphabet, is_known);
    WordSet result(known1.begin(), known1.end());
    if (distance == 1 || !allows_distance2(key)){
        return result;
    }

    // closer matches stay in the result next to the distance 2 ones
    auto known2 = edits::known_edits2(key, alphabet, is_known);
    result.insert(known2.begin(), known2.end());
    VLOG(3) << "[SpellCorrector/search]: " << key << ": " << known1.size() << " at distance 1, "
            << result.size() << " within distance 2";
    return result;
}


std::optional<SpellCorrector::WordSet> SpellCorrector::candidates(const std::string& word) const {
    std::string key = word_frequency_->normalize(word);
    if (!should_check(key) || is_known_key(key)){
        return WordSet{key};
    }

    WordSet result = search(key, distance_);
    if (result.empty() && distance_ == 1){
        VLOG(2) << "[SpellCorrector/candidates]: nothing at distance 1 for " << key << ", retrying at distance 2";
        result = search(key, 2);
    }

    if (result.empty()){
        VLOG(1) << "[SpellCorrector/candidates]: no candidates for " << key;
        return std::nullopt;
    }
    return result;
}


std::optional<SpellCorrector::RankedWords> SpellCorrector::ranked_candidates(const std::string& word) const {
    auto candidates_result = candidates(word);
    if (!candidates_result.has_value()){
        return std::nullopt;
    }

    RankedWords ranked;
    ranked.reserve(candidates_result->size());
    for (const auto& candidate : candidates_result.value()){
        ranked.emplace_back(candidate, word_probability(candidate));
    }
    // most probable first, ties in alphabetical order
    std::sort(ranked.begin(), ranked.end(),
              [](const std::pair<std::string, double>& a, const std::pair<std::string, double>& b){
                  if (a.second == b.second){
                      return a.first < b.first;
                  }
                  return a.second > b.second;
              });
    return ranked;
}


std::optional<std::string> SpellCorrector::correction(const std::string& word) const {
    auto ranked = ranked_candidates(word);
    if (!ranked.has_value() || ranked->empty()){
        return std::nullopt;
    }
    VLOG(2) << "[SpellCorrector/correction]: " << word << " -> " << ranked->front().first;
    return ranked->front().first;
}


std::vector<std::string> SpellCorrector::split_words(const std::string& text){
    return stringmanip::split_words(text);
}


void SpellCorrector::export_dictionary(const fs::path& path, bool gzipped) const {
    io::export_dictionary(path, *word_frequency_, gzipped);
}


    } // namespace correctors
} // namespace spellfix
