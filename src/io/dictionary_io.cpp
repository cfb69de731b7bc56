#include "io/dictionary_io.hpp"
#include "utils/my_utils.hpp"
#include <map>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <glog/logging.h>


using json = nlohmann::json;


namespace spellfix{
    namespace io{


size_t load_dictionary_from_string(const std::string& json_text, vocab::WordFrequency& word_frequency){
    json root;
    try{
        root = json::parse(json_text);
    }
    catch (const json::parse_error& e){
        LOG(WARNING) << "[io/load_dictionary]: malformed json: " << e.what();
        throw std::runtime_error(std::string("malformed dictionary: ") + e.what());
    }

    if (!root.is_object()){
        LOG(WARNING) << "[io/load_dictionary]: expected a json object, got " << root.type_name();
        throw std::runtime_error("dictionary must be a json object of word counts");
    }

    std::map<std::string, long long> word_counts;
    for (const auto& item : root.items()){
        const json& value = item.value();
        if (!value.is_number_integer()){
            LOG(WARNING) << "[io/load_dictionary]: non integer count for " << item.key() << ": " << value.dump();
            throw vocab::invalidCount("count for '" + item.key() + "' is not an integer: " + value.dump());
        }
        if (value.is_number_unsigned() &&
            value.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max())){
            LOG(WARNING) << "[io/load_dictionary]: count out of range for " << item.key();
            throw vocab::invalidCount("count for '" + item.key() + "' is out of range");
        }
        word_counts[item.key()] = value.get<long long>();
    }

    word_frequency.add_many(word_counts);
    return word_counts.size();
}


size_t load_dictionary(const fs::path& path, vocab::WordFrequency& word_frequency){
    LOG(INFO) << "[io/load_dictionary]: loading " << path;
    size_t num_entries = load_dictionary_from_string(myutils::read_file(path), word_frequency);
    LOG(INFO) << "[io/load_dictionary]: read " << num_entries << " entries from " << path
              << ". vocabulary size: " << word_frequency.unique_word_count();
    return num_entries;
}


size_t load_text(const std::string& text, vocab::WordFrequency& word_frequency){
    auto words = stringmanip::split_words(text);
    word_frequency.load_words(words);
    return words.size();
}


size_t load_text_file(const fs::path& path, vocab::WordFrequency& word_frequency){
    LOG(INFO) << "[io/load_text_file]: loading " << path;
    size_t num_tokens = load_text(myutils::read_file(path), word_frequency);
    LOG(INFO) << "[io/load_text_file]: read " << num_tokens << " tokens from " << path;
    return num_tokens;
}


std::string dump_dictionary(const vocab::WordFrequency& word_frequency){
    // std::map keeps the keys sorted in the output
    json root = word_frequency.snapshot();
    return root.dump();
}


void export_dictionary(const fs::path& path, const vocab::WordFrequency& word_frequency, bool gzipped){
    myutils::write_file(path, dump_dictionary(word_frequency), gzipped);
    LOG(INFO) << "[io/export_dictionary]: wrote " << word_frequency.unique_word_count()
              << " words to " << path << (gzipped ? " (gzip)" : "");
}


fs::path language_dictionary_path(const fs::path& resources_dir, const std::string& language){
    std::string code = stringmanip::to_lower(language);
    fs::path compressed = resources_dir / (code + ".json.gz");
    if (fs::exists(compressed)){
        return compressed;
    }
    fs::path plain = resources_dir / (code + ".json");
    if (fs::exists(plain)){
        return plain;
    }
    LOG(WARNING) << "[io/language_dictionary_path]: no dictionary for language " << code
                 << " in " << resources_dir;
    throw std::invalid_argument("The provided dictionary language (" + code + ") does not exist!");
}


    } // namespace io
} // namespace spellfix
