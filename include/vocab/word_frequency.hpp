#ifndef SPELLFIX_WORD_FREQUENCY_HPP
#define SPELLFIX_WORD_FREQUENCY_HPP


#include <string>
#include <vector>
#include <map>
#include <set>
#include <unordered_map>
#include <optional>
#include <iterator>
#include <stdexcept>
#include <cstdint>
#include <cstddef>

/*
The vocabulary backing every correction query:
- counts of each (normalized) word and the running total of all counts
- the letters seen across all words, used as the default edit alphabet
- normalization is lower casing unless the store is case sensitive
*/


namespace spellfix{
    namespace vocab{


typedef uint64_t wordCount;
typedef std::unordered_map<std::string, wordCount> CountMap;


// thrown on a non-positive (or non-integer, when loading) word count
class invalidCount : public std::invalid_argument{
public:
    explicit invalidCount(const std::string& what) : std::invalid_argument(what){}
};


// iterates the stored words without copying them
class wordRange{
public:
    class const_iterator{
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = std::string;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const std::string*;
        using reference         = const std::string&;

        explicit const_iterator(CountMap::const_iterator it) : it_(it){}

        reference operator*() const {return it_->first;}
        pointer operator->() const {return &(it_->first);}
        const_iterator& operator++(){++it_; return *this;}
        const_iterator operator++(int){const_iterator tmp = *this; ++it_; return tmp;}
        bool operator==(const const_iterator& other) const {return it_ == other.it_;}
        bool operator!=(const const_iterator& other) const {return it_ != other.it_;}

    private:
        CountMap::const_iterator it_;
    };

    explicit wordRange(const CountMap& counts) : counts_(counts){}

    const_iterator begin() const {return const_iterator(counts_.cbegin());}
    const_iterator end() const {return const_iterator(counts_.cend());}
    size_t size() const {return counts_.size();}
    bool empty() const {return counts_.empty();}

private:
    const CountMap& counts_;
};


class WordFrequency{
public:
    WordFrequency();
    explicit WordFrequency(bool case_sensitive);
    WordFrequency(bool case_sensitive, std::optional<wordCount> threshold);
    ~WordFrequency();

    // lookup
    wordCount query(const std::string& word) const;
    bool contains(const std::string& word) const {return query(word) > 0;}
    // for keys already passed through normalize(): no copy, no case folding
    wordCount query_normalized(const std::string& key) const;
    bool contains_normalized(const std::string& key) const {return counts_.find(key) != counts_.end();}
    double word_usage_frequency(const std::string& word) const;

    // mutation
    void add(const std::string& word, long long count = 1);
    void add_many(const std::vector<std::string>& words);
    void add_many(const std::map<std::string, long long>& word_counts);
    void load_words(const std::vector<std::string>& words){add_many(words);}
    void remove(const std::string& word);
    void remove_many(const std::vector<std::string>& words);
    std::optional<wordCount> pop(const std::string& word);
    size_t remove_by_threshold(wordCount min_count);
    size_t compact(); // uses the configured threshold, if any

    // getters
    wordCount total_words() const {return total_;}
    size_t unique_word_count() const {return counts_.size();}
    wordRange unique_words() const {return wordRange(counts_);}
    std::string letters() const; // UTF-8, ordered by code point
    const std::set<char32_t>& letter_set() const {return letters_;}
    bool is_case_sensitive() const {return case_sensitive_;}
    std::optional<wordCount> get_threshold() const {return threshold_;}
    void set_threshold(std::optional<wordCount> threshold){threshold_ = threshold;}

    // persistence (sorted so the output is stable)
    std::map<std::string, wordCount> snapshot() const;

    std::string normalize(const std::string& word) const;

private:
    void validate_count(const std::string& word, long long count) const;
    void insert_normalized(const std::string& key, wordCount count);
    void update_letters(const std::string& key);

private:
    CountMap counts_;
    wordCount total_ = 0;
    std::set<char32_t> letters_;
    bool case_sensitive_ = false;
    std::optional<wordCount> threshold_;
};


    } // namespace vocab
} // namespace spellfix


#endif // SPELLFIX_WORD_FREQUENCY_HPP
