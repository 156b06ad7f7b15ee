#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace typanon {

[[nodiscard]] bool read_file_in_buffer(
    std::ostream& err_stream, const std::string& path, std::string& buffer);

[[nodiscard]] bool read_stream_in_buffer(
    std::istream& input, std::string& buffer);

[[nodiscard]] bool write_buffer_to_file(std::ostream& err_stream,
    const std::string& path, const std::string_view buffer);

} // namespace typanon
