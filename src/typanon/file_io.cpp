#include "file_io.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

#include <cstddef>

namespace typanon {

bool read_file_in_buffer(
    std::ostream& err_stream, const std::string& path, std::string& buffer)
{
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs)
    {
        err_stream << "((IO ERROR)): Failed to open file '" << path << "'\n\n";
        return false;
    }

    const auto size = static_cast<std::streamsize>(ifs.tellg());
    if (size < 0)
    {
        err_stream << "((IO ERROR)): Failed to read file '" << path << "'\n\n";
        return false;
    }

    ifs.seekg(0, std::ios::beg);

    buffer.clear();
    buffer.resize(static_cast<std::size_t>(size));

    if (!ifs.read(buffer.data(), size))
    {
        err_stream << "((IO ERROR)): Failed to read file '" << path << "'\n\n";
        return false;
    }

    return true;
}

bool read_stream_in_buffer(std::istream& input, std::string& buffer)
{
    buffer.assign(std::istreambuf_iterator<char>{input},
        std::istreambuf_iterator<char>{});

    return !input.bad();
}

bool write_buffer_to_file(std::ostream& err_stream, const std::string& path,
    const std::string_view buffer)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        err_stream << "((IO ERROR)): Failed to open file '" << path
                   << "' for writing\n\n";

        return false;
    }

    ofs.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    ofs.flush();

    if (!ofs)
    {
        err_stream << "((IO ERROR)): Failed to write file '" << path << "'\n\n";
        return false;
    }

    return true;
}

} // namespace typanon
