#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include "paste_lib.h"

//////////////////////////////////////////////////////////////////////
// shared helpers for the paste_lib tests

namespace paste_test
{
    inline paste_lib::paste_error_code parse_text(paste_lib::paste_file &file, std::string const &text)
    {
        return file.parse_memory(text.data(), text.size());
    }

    //////////////////////////////////////////////////////////////////////
    // a file in the temp directory which is deleted when this goes out of scope

    struct temp_file
    {
        std::filesystem::path path;

        explicit temp_file(std::string const &name, std::string const &contents)
        {
            path = std::filesystem::temp_directory_path() / name;
            std::ofstream out(path, std::ios::binary);
            out << contents;
        }

        ~temp_file()
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        std::string name() const
        {
            return path.string();
        }
    };

}    // namespace paste_test
