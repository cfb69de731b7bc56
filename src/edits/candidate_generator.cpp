#include "edits/candidate_generator.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>


namespace spellfix{
    namespace edits{


typedef std::unordered_set<std::u32string> CodePointSet;


static CodePointSet code_point_edits1(const std::u32string& word, const std::u32string& alphabet){
    CodePointSet result;
    result.reserve(max_edits1_size(word.size(), alphabet.size()));
    for_each_edit1(word, alphabet, [&result](const std::u32string& candidate){
        result.insert(candidate);
    });
    return result;
}


EditSet edits1(const std::string& word, const std::string& alphabet){
    const std::u32string letters = myutils::to_code_points(alphabet);
    EditSet result;
    result.reserve(max_edits1_size(myutils::code_point_length(word), letters.size()));
    for_each_edit1(myutils::to_code_points(word), letters, [&result](const std::u32string& candidate){
        result.insert(myutils::to_utf8(candidate));
    });
    VLOG(4) << "[edits/edits1]: " << word << " -> " << result.size() << " candidates";
    return result;
}


EditSet edits2(const std::string& word, const std::string& alphabet){
    const std::u32string letters = myutils::to_code_points(alphabet);
    EditSet result;
    for (const auto& first_edit : code_point_edits1(myutils::to_code_points(word), letters)){
        for_each_edit1(first_edit, letters, [&result](const std::u32string& candidate){
            result.insert(myutils::to_utf8(candidate));
        });
    }
    VLOG(3) << "[edits/edits2]: " << word << " -> " << result.size() << " candidates";
    return result;
}


EditSet known_edits1(const std::string& word, const std::string& alphabet, const WordPredicate& is_known){
    EditSet result;
    std::string encoded;
    for_each_edit1(myutils::to_code_points(word), myutils::to_code_points(alphabet),
                   [&result, &is_known, &encoded](const std::u32string& candidate){
        encoded = myutils::to_utf8(candidate);
        if (is_known(encoded)){
            result.insert(encoded);
        }
    });
    return result;
}


EditSet known_edits2(const std::string& word, const std::string& alphabet, const WordPredicate& is_known){
    const std::u32string letters = myutils::to_code_points(alphabet);
    EditSet result;
    std::string encoded;
    size_t visited = 0;
    for (const auto& first_edit : code_point_edits1(myutils::to_code_points(word), letters)){
        for_each_edit1(first_edit, letters, [&result, &is_known, &visited, &encoded](const std::u32string& candidate){
            ++visited;
            encoded = myutils::to_utf8(candidate);
            if (is_known(encoded)){
                result.insert(encoded);
            }
        });
    }
    VLOG(3) << "[edits/known_edits2]: " << word << ": visited " << visited
            << " strings, kept " << result.size();
    return result;
}


    } // namespace edits
} // namespace spellfix
