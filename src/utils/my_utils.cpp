#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <system_error>
#include <stdexcept>
#include <zlib.h>
#include <unicode/utf8.h>
#include <unicode/uchar.h>
#include <glog/logging.h>
#include "utils/my_utils.hpp"


namespace spellfix {
    namespace myutils{

        bool is_gzip_path(const fs::path& path){
            std::string extension = path.extension().string();
            std::transform(extension.begin(), extension.end(), extension.begin(),
                            [](unsigned char c){return std::tolower(c);});
            return extension == ".gz";
        }

        static std::string read_gzip_file(const fs::path& path){
            gzFile gz_file = gzopen(path.string().c_str(), "rb");
            if (gz_file == nullptr){
                LOG(WARNING) << "[myutils/read_gzip_file]: failed to open " << path;
                throw std::runtime_error("could not open gzip file: " + path.string());
            }

            std::string data;
            char chunk[16384];
            int read_bytes = 0;
            while ((read_bytes = gzread(gz_file, chunk, sizeof(chunk))) > 0){
                data.append(chunk, static_cast<size_t>(read_bytes));
            }

            if (read_bytes < 0){
                int err_num = 0;
                std::string message = gzerror(gz_file, &err_num);
                gzclose(gz_file);
                LOG(WARNING) << "[myutils/read_gzip_file]: failed reading " << path << ": " << message;
                throw std::runtime_error("corrupted gzip file: " + path.string());
            }
            gzclose(gz_file);
            VLOG(2) << "[myutils/read_gzip_file]: read " << data.size() << " bytes from " << path;
            return data;
        }

        std::string read_file(const fs::path& path){
            if (!fs::exists(path)){
                LOG(WARNING) << "[myutils/read_file]: path " << path << " does not exist";
                throw std::runtime_error("file does not exist: " + path.string());
            }
            if (is_gzip_path(path)){
                return read_gzip_file(path);
            }

            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()){
                LOG(WARNING) << "[myutils/read_file]: failed to open " << path;
                throw std::runtime_error("could not open file: " + path.string());
            }
            std::ostringstream oss;
            oss << file.rdbuf();
            return oss.str();
        }

        void write_file(const fs::path& path, const std::string& data, bool gzipped){
            if (gzipped){
                gzFile gz_file = gzopen(path.string().c_str(), "wb");
                if (gz_file == nullptr){
                    LOG(WARNING) << "[myutils/write_file]: failed to open " << path << " for writing";
                    throw std::runtime_error("could not open gzip file for writing: " + path.string());
                }
                int written = data.empty() ? 0 : gzwrite(gz_file, data.data(), static_cast<unsigned>(data.size()));
                int close_status = gzclose(gz_file);
                if ((!data.empty() && written <= 0) || close_status != Z_OK){
                    LOG(WARNING) << "[myutils/write_file]: failed writing " << path;
                    throw std::runtime_error("could not write gzip file: " + path.string());
                }
                return;
            }

            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()){
                LOG(WARNING) << "[myutils/write_file]: failed to open " << path << " for writing";
                throw std::runtime_error("could not open file for writing: " + path.string());
            }
            file << data;
            file.flush();
            if (!file){
                LOG(WARNING) << "[myutils/write_file]: failed writing " << path;
                throw std::runtime_error("could not write file: " + path.string());
            }
        }

        // stray bytes map to lone low surrogates, which valid UTF-8 never decodes to
        static constexpr char32_t RAW_BYTE_BASE = 0xDC00;

        static bool is_raw_byte(char32_t code_point){
            return code_point >= RAW_BYTE_BASE + 0x80 && code_point <= RAW_BYTE_BASE + 0xFF;
        }

        std::u32string to_code_points(const std::string& text){
            std::u32string result;
            result.reserve(text.size());
            const uint8_t* bytes = reinterpret_cast<const uint8_t*>(text.data());
            const int32_t length = static_cast<int32_t>(text.size());
            int32_t i = 0;
            while (i < length){
                const int32_t start = i;
                UChar32 c;
                U8_NEXT(bytes, i, length, c);
                if (c < 0){
                    result.push_back(RAW_BYTE_BASE + bytes[start]);
                    i = start + 1;
                    continue;
                }
                result.push_back(static_cast<char32_t>(c));
            }
            return result;
        }

        std::string to_utf8(char32_t code_point){
            if (is_raw_byte(code_point)){
                return std::string(1, static_cast<char>(code_point - RAW_BYTE_BASE));
            }
            uint8_t buffer[U8_MAX_LENGTH];
            int32_t length = 0;
            U8_APPEND_UNSAFE(buffer, length, static_cast<UChar32>(code_point));
            return std::string(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
        }

        std::string to_utf8(const std::u32string& code_points){
            std::string result;
            result.reserve(code_points.size());
            for (const auto& code_point : code_points){
                if (code_point < 0x80){
                    result.push_back(static_cast<char>(code_point));
                    continue;
                }
                result += to_utf8(code_point);
            }
            return result;
        }

        size_t code_point_length(const std::string& text){
            return to_code_points(text).size();
        }

    } // namespace myutils

    namespace stringmanip{
        static bool is_word_char(char32_t c){
            if (c == U'_'){
                return true;
            }
            UChar32 code_point = static_cast<UChar32>(c);
            return u_isalnum(code_point) || (U_GET_GC_MASK(code_point) & U_GC_M_MASK) != 0;
        }

        std::vector<std::string> split_words(const std::string& text){
            const std::u32string code_points = myutils::to_code_points(text);
            std::vector<std::string> result;
            size_t pos = 0;
            while (pos < code_points.size()){
                if (!is_word_char(code_points[pos])){
                    ++pos;
                    continue;
                }
                // extend over word chars and apostrophes, then drop trailing apostrophes
                size_t end = pos + 1;
                size_t last_word_char = pos;
                while (end < code_points.size()){
                    char32_t c = code_points[end];
                    if (is_word_char(c)){
                        last_word_char = end;
                    }
                    else if (c != U'\''){
                        break;
                    }
                    ++end;
                }
                result.push_back(myutils::to_utf8(code_points.substr(pos, last_word_char - pos + 1)));
                pos = last_word_char + 1;
            }
            return result;
        }

        void lower_case(std::string& sequence){
            bool ascii = std::all_of(sequence.begin(), sequence.end(),
                                     [](unsigned char c){return c < 0x80;});
            if (ascii){
                std::transform(sequence.begin(), sequence.end(),sequence.begin(),
                                [](unsigned char c){return std::tolower(c);});
                return;
            }
            std::u32string code_points = myutils::to_code_points(sequence);
            for (auto& code_point : code_points){
                code_point = static_cast<char32_t>(u_tolower(static_cast<UChar32>(code_point)));
            }
            sequence = myutils::to_utf8(code_points);
        }

        std::string to_lower(std::string sequence){
            lower_case(sequence);
            return sequence;
        }

        bool should_check(const std::string& word){
            if (word.size() == 1 && std::ispunct(static_cast<unsigned char>(word[0]))){
                return false;
            }
            if (word.empty()){
                return true;
            }
            // decimal numbers (ints, floats, exponents) are skipped, parsed independently of the locale.
            // from_chars reads "0x1f" as 0 followed by text, so hex stays a word
            const char* begin = word.data();
            const char* end = begin + word.size();
            if (*begin == '+'){
                ++begin;
                if (begin == end || *begin == '-'){
                    return true;
                }
            }
            double value = 0.0;
            auto parsed = std::from_chars(begin, end, value);
            bool is_number = (parsed.ec == std::errc() || parsed.ec == std::errc::result_out_of_range) && parsed.ptr == end;
            return !is_number;
        }
    } // stringmanip

} //namespace spellfix
