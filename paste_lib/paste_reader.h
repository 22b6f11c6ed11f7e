#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "paste_error.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////
    // whole stream is read up front, then handed out a line at a time

    struct paste_reader
    {
        paste_reader() = default;

        paste_error_code open(char const *file_path);

        paste_error_code open(char const *data, size_t size);

        void close();

        bool eof() const;

        // line has surrounding whitespace (and any \r) removed, may be empty
        paste_error_code read_line(std::string_view *line);

        //////////////////////////////////////////////////////////////////////

        // number of the line most recently returned by read_line, 1 based
        int line_number{};

        char const *file_data{ nullptr };
        size_t file_size{};
        size_t file_pos{};

        std::string filename;
        std::vector<char> file_buffer;
    };

    //////////////////////////////////////////////////////////////////////

    enum tokenize_option
    {
        tokenize_remove_empty,
        tokenize_keep_empty,
    };

    template <typename T> void tokenize(std::string_view const str, T &tokens, std::string_view const delimiter, tokenize_option option)
    {
        if(option == tokenize_keep_empty) {
            size_t start = 0;
            while(true) {
                size_t end = str.find_first_of(delimiter, start);
                tokens.push_back(typename T::value_type(str.substr(start, end - start)));
                if(end == std::string_view::npos) {
                    break;
                }
                start = end + 1;
            }
            return;
        }
        size_t start = str.find_first_not_of(delimiter);
        while(start != std::string_view::npos) {
            size_t end = str.find_first_of(delimiter, start);
            tokens.push_back(typename T::value_type(str.substr(start, end - start)));
            start = str.find_first_not_of(delimiter, end);
        }
    }

}    // namespace paste_lib
