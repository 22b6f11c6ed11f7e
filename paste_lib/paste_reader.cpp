//////////////////////////////////////////////////////////////////////

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

#include "paste_error.h"
#include "paste_reader.h"
#include "paste_util.h"

LOG_CONTEXT("line_reader", info);

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    paste_error_code paste_reader::open(char const *data, size_t size)
    {
        if(data == nullptr) {
            return error_invalid_parameter;
        }
        file_buffer.clear();
        file_data = data;
        file_size = size;
        file_pos = 0;
        line_number = 0;
        filename = fmt::format("mem:{}:{}", static_cast<void const *>(file_data), file_size);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code paste_reader::open(char const *file_path)
    {
        if(file_path == nullptr) {
            return error_internal_bad_pointer;
        }

        std::error_code ec;

        if(!std::filesystem::exists(file_path, ec)) {
            LOG_ERROR("File not found: {}", file_path);
            return error_file_not_found;
        }

        if(!std::filesystem::is_regular_file(file_path, ec)) {
            LOG_ERROR("Not a regular file: {}", file_path);
            return error_invalid_file_attributes;
        }

        size_t file_bytes = std::filesystem::file_size(file_path, ec);

        if(ec) {
            LOG_ERROR("Can't get size of {}: {}", file_path, ec.message());
            return error_cant_open_file;
        }

        std::ifstream in_stream(file_path, std::ios::binary);

        if(!in_stream.is_open()) {
            LOG_ERROR("Error opening file {}: {}", file_path, std::generic_category().message(errno));
            return error_cant_open_file;
        }

        file_buffer.clear();
        file_buffer.reserve(file_bytes);
        file_buffer.assign(std::istreambuf_iterator<char>(in_stream), std::istreambuf_iterator<char>());

        if(in_stream.bad()) {
            LOG_ERROR("Error reading file {}", file_path);
            return error_cant_open_file;
        }

        file_data = file_buffer.data();
        file_size = file_buffer.size();

        filename.assign(file_path);
        LOG_VERBOSE("Opened file {}, {} bytes available", filename, file_size);
        file_pos = 0;
        line_number = 0;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    void paste_reader::close()
    {
        file_data = nullptr;
        file_size = 0;
        file_pos = 0;
        line_number = 0;
        filename.clear();
        file_buffer.clear();
    }

    //////////////////////////////////////////////////////////////////////

    bool paste_reader::eof() const
    {
        return file_pos >= file_size;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code paste_reader::read_line(std::string_view *line)
    {
        if(line == nullptr) {
            return error_internal_bad_pointer;
        }
        if(eof()) {
            return error_end_of_file;
        }
        size_t start = file_pos;
        while(file_pos < file_size && file_data[file_pos] != '\n') {
            file_pos += 1;
        }
        size_t end = file_pos;
        if(file_pos < file_size) {
            file_pos += 1;    // eat the \n
        }
        line_number += 1;
        *line = paste_util::trim(std::string_view(file_data + start, end - start));
        return ok;
    }

}    // namespace paste_lib
