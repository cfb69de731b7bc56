#include "vocab/word_frequency.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>


namespace spellfix{
    namespace vocab{

WordFrequency::WordFrequency() : WordFrequency(false, std::nullopt){}


WordFrequency::WordFrequency(bool case_sensitive) : WordFrequency(case_sensitive, std::nullopt){}


WordFrequency::WordFrequency(bool case_sensitive, std::optional<wordCount> threshold) :
 case_sensitive_(case_sensitive), threshold_(threshold){
    DLOG(INFO) << "[WordFrequency/constructor]: instance created. case sensitive: " << case_sensitive_;
}


WordFrequency::~WordFrequency(){
    DLOG(INFO) << "[WordFrequency/destructor]: releasing " << counts_.size() << " words";
}


std::string WordFrequency::normalize(const std::string& word) const {
    if (case_sensitive_){
        return word;
    }
    return stringmanip::to_lower(word);
}


wordCount WordFrequency::query(const std::string& word) const {
    return query_normalized(normalize(word));
}


wordCount WordFrequency::query_normalized(const std::string& key) const {
    auto it = counts_.find(key);
    if (it == counts_.end()){
        return 0;
    }
    return it->second;
}


double WordFrequency::word_usage_frequency(const std::string& word) const {
    if (total_ == 0){
        return 0.0;
    }
    return static_cast<double>(query(word)) / static_cast<double>(total_);
}


void WordFrequency::validate_count(const std::string& word, long long count) const {
    if (count <= 0){
        LOG(WARNING) << "[WordFrequency/validate_count]: rejected count " << count << " for word: " << word;
        throw invalidCount("word count must be a positive integer, got " + std::to_string(count) + " for '" + word + "'");
    }
}


void WordFrequency::update_letters(const std::string& key){
    for (const auto& letter : myutils::to_code_points(key)){
        letters_.insert(letter);
    }
}


void WordFrequency::insert_normalized(const std::string& key, wordCount count){
    if (key.empty()){
        DLOG(WARNING) << "[WordFrequency/insert_normalized]: skipping empty word";
        return;
    }
    counts_[key] += count;
    total_ += count;
    update_letters(key);
    VLOG(4) << "[WordFrequency/insert_normalized]: " << key << " -> " << counts_[key];
}


void WordFrequency::add(const std::string& word, long long count){
    validate_count(word, count);
    insert_normalized(normalize(word), static_cast<wordCount>(count));
}


void WordFrequency::add_many(const std::vector<std::string>& words){
    for (const auto& word : words){
        insert_normalized(normalize(word), 1);
    }
    VLOG(2) << "[WordFrequency/add_many]: loaded " << words.size() << " tokens. total: " << total_;
}


void WordFrequency::add_many(const std::map<std::string, long long>& word_counts){
    // check everything first so a bad entry leaves the store untouched
    for (const auto& entry : word_counts){
        validate_count(entry.first, entry.second);
    }
    for (const auto& entry : word_counts){
        insert_normalized(normalize(entry.first), static_cast<wordCount>(entry.second));
    }
    VLOG(2) << "[WordFrequency/add_many]: loaded " << word_counts.size() << " entries. total: " << total_;
}


std::optional<wordCount> WordFrequency::pop(const std::string& word){
    auto it = counts_.find(normalize(word));
    if (it == counts_.end()){
        return std::nullopt;
    }
    wordCount removed = it->second;
    total_ -= removed;
    counts_.erase(it);
    VLOG(4) << "[WordFrequency/pop]: removed " << word << " (" << removed << ")";
    return removed;
}


void WordFrequency::remove(const std::string& word){
    pop(word);
}


void WordFrequency::remove_many(const std::vector<std::string>& words){
    for (const auto& word : words){
        remove(word);
    }
}


size_t WordFrequency::remove_by_threshold(wordCount min_count){
    size_t removed = 0;
    for (auto it = counts_.begin(); it != counts_.end();){
        if (it->second < min_count){
            total_ -= it->second;
            it = counts_.erase(it);
            ++removed;
            continue;
        }
        ++it;
    }
    LOG(INFO) << "[WordFrequency/remove_by_threshold]: removed " << removed
              << " words below " << min_count << ". remaining: " << counts_.size();
    return removed;
}


size_t WordFrequency::compact(){
    if (!threshold_.has_value()){
        LOG(WARNING) << "[WordFrequency/compact]: no threshold is configured";
        return 0;
    }
    return remove_by_threshold(threshold_.value());
}


std::string WordFrequency::letters() const {
    return myutils::to_utf8(std::u32string(letters_.begin(), letters_.end()));
}


std::map<std::string, wordCount> WordFrequency::snapshot() const {
    return std::map<std::string, wordCount>(counts_.begin(), counts_.end());
}


    } // namespace vocab
} // namespace spellfix
