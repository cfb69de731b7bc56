#ifndef SPELLFIX_CANDIDATE_GENERATOR_HPP
#define SPELLFIX_CANDIDATE_GENERATOR_HPP


#include <string>
#include <unordered_set>
#include <functional>
#include <utility>
#include <cstddef>


namespace spellfix{
    namespace edits{

typedef std::unordered_set<std::string> EditSet;
typedef std::function<bool(const std::string&)> WordPredicate;


// upper bound on edits1 output before de-duplication, lengths in characters
inline size_t max_edits1_size(size_t word_length, size_t alphabet_size){
    size_t deletes    = word_length;
    size_t transposes = word_length > 0 ? word_length - 1 : 0;
    size_t replaces   = word_length * alphabet_size;
    size_t inserts    = (word_length + 1) * alphabet_size;
    return deletes + transposes + replaces + inserts;
}


/*
Calls visit(candidate) for every string one edit away from word:
deletes, adjacent transposes, replaces and inserts over the alphabet.
Works on code points so a multi-byte letter is edited as one character.
The same string may be visited more than once and the empty string is never visited.
*/
template <typename Visitor>
void for_each_edit1(const std::u32string& word, const std::u32string& alphabet, Visitor&& visit){
    const size_t n = word.size();
    std::u32string candidate;
    candidate.reserve(n + 1);

    for (size_t i = 0; i <= n; ++i){
        // deletes
        if (i < n && n > 1){
            candidate.assign(word, 0, i);
            candidate.append(word, i + 1, std::u32string::npos);
            visit(candidate);
        }
        // transposes
        if (i + 1 < n){
            candidate = word;
            std::swap(candidate[i], candidate[i + 1]);
            visit(candidate);
        }
        // replaces
        if (i < n){
            candidate = word;
            for (const auto& letter : alphabet){
                candidate[i] = letter;
                visit(candidate);
            }
        }
        // inserts
        for (const auto& letter : alphabet){
            candidate.assign(word, 0, i);
            candidate.push_back(letter);
            candidate.append(word, i, std::u32string::npos);
            visit(candidate);
        }
    }
}


// word and alphabet are UTF-8, every letter of the alphabet is one edit character
EditSet edits1(const std::string& word, const std::string& alphabet);
EditSet edits2(const std::string& word, const std::string& alphabet);
// distance <= 2 strings accepted by is_known, without building the full edits2 set
EditSet known_edits2(const std::string& word, const std::string& alphabet, const WordPredicate& is_known);
EditSet known_edits1(const std::string& word, const std::string& alphabet, const WordPredicate& is_known);


    } // namespace edits
} // namespace spellfix


#endif // SPELLFIX_CANDIDATE_GENERATOR_HPP
